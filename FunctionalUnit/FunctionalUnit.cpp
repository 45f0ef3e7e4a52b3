#include "FunctionalUnit.h"
#include "RegisterFile.h"
#include "Memory.h"
#include <algorithm>

FunctionalUnit::FunctionalUnit(UnitClass type, int cycles, int numRS)
    : type(type), numCycles(cycles), numReservationStation(numRS > 0 ? numRS : 0) {}

UnitClass FunctionalUnit::getType() const
{
    return type;
}

vector<ReservationStation> &FunctionalUnit::getReservationStations()
{
    return numReservationStation;
}

const vector<ReservationStation> &FunctionalUnit::getReservationStations() const
{
    return numReservationStation;
}

bool FunctionalUnit::freeRS() const
{
    return freeRSIndex() != -1;
}

int FunctionalUnit::freeRSIndex() const
{
    for (size_t i = 0; i < numReservationStation.size(); i++)
    {
        if (!numReservationStation[i].busy())
            return static_cast<int>(i);
    }
    return -1; // No free RS
}

int FunctionalUnit::allocate(const Instruction &ins, int Vj, int Vk, int Qj, int Qk,
                             int A, int Qa, int robIndex, int seq)
{
    int idx = freeRSIndex();
    if (idx == -1)
        return -1;

    int target = (ins.opcode == Opcode::BEQ || ins.opcode == Opcode::CALL) ? ins.branchTarget() : -1;
    numReservationStation[idx].setValues(ins.opcode, Vj, Vk, Qj, Qk, A, Qa,
                                         robIndex, seq, ins.index, target, numCycles);
    return idx;
}

TickEvents FunctionalUnit::executeCycle(const Memory &mem, const StartGate &gate)
{
    TickEvents ev;
    for (auto &rs : numReservationStation)
    {
        if (rs.state == SlotState::WAITING)
        {
            // tagged operands do not consume latency
            if (!rs.operandsReady() || (gate && !gate(rs)))
                continue;
            rs.state = SlotState::EXECUTING;
            ev.started.push_back(rs.Dest);
        }
        if (rs.state != SlotState::EXECUTING)
            continue;

        rs.remainingLat--;
        if (rs.remainingLat <= 0)
        {
            rs.execute(mem);
            ev.finished.push_back(rs.Dest);
        }
    }
    return ev;
}

void FunctionalUnit::deliver(int tag, int value)
{
    for (auto &rs : numReservationStation)
        rs.deliver(tag, value);
}

vector<CompletedResult> FunctionalUnit::takeFinished()
{
    vector<CompletedResult> results;
    for (auto &rs : numReservationStation)
    {
        if (rs.state == SlotState::FINISHED)
        {
            results.push_back(rs.result);
            rs.clear();
        }
    }
    return results;
}

void FunctionalUnit::squash(const vector<int> &robIndices)
{
    for (auto &rs : numReservationStation)
    {
        if (rs.busy() && find(robIndices.begin(), robIndices.end(), rs.Dest) != robIndices.end())
            rs.clear();
    }
}
