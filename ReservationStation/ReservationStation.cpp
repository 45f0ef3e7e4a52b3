#include "ReservationStation.h"
#include "RegisterFile.h"
#include "Memory.h"

// Default constructor
ReservationStation::ReservationStation()
{
    clear();
}

bool ReservationStation::busy() const
{
    return state != SlotState::IDLE;
}

bool ReservationStation::operandsReady() const
{
    return Qj == NO_TAG && Qk == NO_TAG && addrReady;
}

// Initialize RS fields when issuing an instruction
void ReservationStation::setValues(Opcode OP, int Vj_val, int Vk_val,
                                   int Qj_tag, int Qk_tag,
                                   int address, int Qa_tag,
                                   int destROB, int robSeq, int instrIdx, int tgt, int latency)
{
    state = SlotState::WAITING;
    op = OP;
    Vj = Vj_val;
    Vk = Vk_val;
    Qj = Qj_tag;
    Qk = Qk_tag;
    A = address;
    Qa = Qa_tag;
    addrReady = (Qa_tag == NO_TAG);
    Dest = destROB;
    seq = robSeq;
    instrIndex = instrIdx;
    target = tgt;
    remainingLat = latency;
    result = CompletedResult();
}

bool ReservationStation::deliver(int tag, int value)
{
    if (state != SlotState::WAITING || tag == NO_TAG)
        return false;

    bool hit = false;
    if (Qj == tag)
    {
        Vj = value;
        Qj = NO_TAG;
        hit = true;
    }
    if (Qk == tag)
    {
        Vk = value;
        Qk = NO_TAG;
        hit = true;
    }
    if (Qa == tag)
    {
        A = value + A; // base + displacement
        Qa = NO_TAG;
        addrReady = true;
        hit = true;
    }
    return hit;
}

void ReservationStation::execute(const Memory &mem)
{
    result.robIndex = Dest;
    result.seq = seq;
    result.instrIndex = instrIndex;
    result.op = op;
    result.value = 0;
    result.address = -1;
    result.fault = false;
    result.nextIndex = instrIndex + 1;

    switch (op)
    {
    case Opcode::ADD:
    case Opcode::ADDI:
        result.value = wrap16((long long)Vj + Vk);
        break;
    case Opcode::NAND:
        result.value = wrap16(~(Vj & Vk));
        break;
    case Opcode::MUL:
        result.value = wrap16((long long)Vj * Vk); // lower 16 bits
        break;
    case Opcode::LOAD:
        result.address = A;
        if (mem.inBounds(A))
            result.value = mem.load(A);
        else
            result.fault = true;
        break;
    case Opcode::STORE:
        // memory is written at commit
        result.address = A;
        result.value = wrap16(Vj);
        break;
    case Opcode::BEQ:
        result.value = (Vj == Vk) ? 1 : 0;
        result.nextIndex = result.value ? target : instrIndex + 1;
        break;
    case Opcode::CALL:
        result.value = wrap16(instrIndex + 1); // return address
        result.nextIndex = target;
        break;
    case Opcode::RET:
        result.value = Vj;
        result.nextIndex = Vj;
        break;
    }
    state = SlotState::FINISHED;
}

// Reset RS for next instruction
void ReservationStation::clear()
{
    state = SlotState::IDLE;
    op = Opcode::ADD;
    Qj = NO_TAG;
    Qk = NO_TAG;
    Vj = 0;
    Vk = 0;
    A = 0;
    Qa = NO_TAG;
    addrReady = true;
    Dest = -1;
    seq = -1;

    instrIndex = -1;
    target = -1;
    remainingLat = 0;
    result = CompletedResult();
}
