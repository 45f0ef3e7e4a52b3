#ifndef FUNCTIONALUNIT_H
#define FUNCTIONALUNIT_H
#include "ReservationStation.h"
#include <vector>
#include <functional>
using namespace std;

class Memory;

// Slot changes produced by one execute tick, as ROB indices
struct TickEvents
{
    vector<int> started;
    vector<int> finished;
};

// One pool of reservation stations per functional-unit class
class FunctionalUnit
{
public:
    // Admission check for a slot whose operands are ready (load ordering)
    typedef function<bool(const ReservationStation &)> StartGate;

    FunctionalUnit(UnitClass type, int cycles, int numRS);

    UnitClass getType() const;
    vector<ReservationStation> &getReservationStations();
    const vector<ReservationStation> &getReservationStations() const;

    bool freeRS() const;     // check if a reservation station is free
    int freeRSIndex() const; // -1 if none

    // Returns the slot index, or -1 leaving the pool untouched
    int allocate(const Instruction &ins, int Vj, int Vk, int Qj, int Qk,
                 int A, int Qa, int robIndex, int seq);

    // Advance every ready slot by one cycle
    TickEvents executeCycle(const Memory &mem, const StartGate &gate);

    // Broadcast listener: resolve every operand waiting on tag
    void deliver(int tag, int value);

    vector<CompletedResult> takeFinished(); // results are returned and their slots released

    void squash(const vector<int> &robIndices);

private:
    UnitClass type;
    int numCycles;
    vector<ReservationStation> numReservationStation;
};

#endif // FUNCTIONALUNIT_H
