#ifndef ROB_H
#define ROB_H
#include "Instructions.h"
#include "ReservationStation.h"
#include <vector>
using namespace std;

class RegisterFile;
class Memory;

enum class RobState
{
    ISSUED,
    EXECUTING,
    WRITTEN,
    COMMITTED
};

struct ROBEntry
{
    bool busy;       // allocated and not yet committed or squashed
    RobState state;
    Opcode op;
    int dest;        // destination register, NO_REG for STORE / BEQ / RET
    int value;       // register result, store data or branch outcome
    int address;     // STORE target, valid once written
    bool fault;      // LOAD read outside memory
    int nextIndex;   // control instructions: resolved next fetch index
    bool resolvedAtIssue; // BEQ already redirected fetch, skip the write-result check
    int instrIndex;  // static program index
    int seq;         // allocation order, unique per dynamic instruction
    int record;      // engine bookkeeping slot for timestamps

    bool isStore() const { return op == Opcode::STORE; }
};

class ROB
{
public:
    explicit ROB(int capacity = 8);

    bool isFull() const;
    bool isEmpty() const;
    int size() const;
    int capacity() const;

    // Returns the new entry index, or -1 when full
    int addEntry(const Instruction &ins, int seq, int record);
    void markExecuting(int robNum);
    void markReady(const CompletedResult &res);
    void markResolvedAtIssue(int robNum, int nextIndex);

    const ROBEntry &entry(int robNum) const;
    bool isLive(int robNum, int seq) const;
    int next(int robNum) const;
    int youngerCount(int robNum) const; // live entries allocated after robNum

    // Commit the head if written: register and memory writeback happen here.
    // Throws MemoryBoundsError for a faulting LOAD or an out-of-range STORE.
    bool commitHead(RegisterFile &regs, Memory &mem, ROBEntry &committed, int cycle);

    // Invalidate robNum and every younger entry; older entries are untouched.
    // Register tags naming squashed entries fall back to the youngest surviving producer.
    vector<ROBEntry> squashFrom(int robNum, RegisterFile &regs);

    // Load ordering queries, relative to the entry at robNum
    bool hasOlderStore(int robNum) const;
    bool olderStoreConflicts(int robNum, int address) const;

private:
    void clearEntry(int idx);

    int head;
    int tail;
    int count;

    vector<ROBEntry> entries;
};

#endif // ROB_H
