#ifndef RESERVATIONSTATION_H
#define RESERVATIONSTATION_H
#include "Instructions.h"

class Memory;

enum class SlotState
{
    IDLE,      // free
    WAITING,   // issued, operands or address still tagged
    EXECUTING, // consuming latency
    FINISHED   // result held until the next broadcast
};

// What a finished slot puts on the common data bus
struct CompletedResult
{
    int robIndex;
    int seq;
    int instrIndex;
    Opcode op;
    int value;       // register result, store data, branch outcome or return target
    int address;     // effective address (LOAD / STORE)
    bool fault;      // LOAD outside memory; raised when the entry commits
    int nextIndex;   // control instructions: where fetch must continue
};

class ReservationStation
{
public:
    ReservationStation();

    SlotState state;
    Opcode op;

    // Operand tags and values
    int Qj, Qk; // producer tags (NO_TAG = value ready)
    int Vj, Vk; // operand values

    // Memory operand: displacement until the base arrives, then the effective address
    int A;
    int Qa; // tag of the base register while the address is pending
    bool addrReady;

    int Dest; // owning ROB entry; also the tag this slot broadcasts under
    int seq;  // allocation sequence of that entry, checked before its result is accepted

    int instrIndex;   // static program index, for records and the trace
    int target;       // control transfer target (BEQ / CALL)
    int remainingLat; // cycles left in the execute phase

    CompletedResult result;

    bool busy() const;
    bool operandsReady() const;

    void setValues(Opcode OP, int Vj_val, int Vk_val,
                   int Qj_tag, int Qk_tag,
                   int address, int Qa_tag,
                   int destROB, int robSeq, int instrIdx, int tgt, int latency);

    // Common data bus listener; true if any field was waiting on tag
    bool deliver(int tag, int value);

    // Compute the result once remainingLat reaches zero
    void execute(const Memory &mem);

    void clear(); // reset RS for next instruction
};

#endif // RESERVATIONSTATION_H
