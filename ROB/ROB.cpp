#include "ROB.h"
#include "RegisterFile.h"
#include "Memory.h"
#include "SimErrors.h"
#include <set>
#include <string>

ROB::ROB(int capacity) : head(0), tail(0), count(0), entries(capacity > 0 ? capacity : 1)
{
    // Initialize all ROB entries
    for (int i = 0; i < (int)entries.size(); i++)
        clearEntry(i);
}

void ROB::clearEntry(int idx)
{
    ROBEntry &e = entries[idx];
    e.busy = false;
    e.state = RobState::ISSUED;
    e.op = Opcode::ADD;
    e.dest = NO_REG;
    e.value = 0;
    e.address = -1;
    e.fault = false;
    e.nextIndex = -1;
    e.resolvedAtIssue = false;
    e.instrIndex = -1;
    e.seq = -1;
    e.record = -1;
}

bool ROB::isFull() const
{
    return count == (int)entries.size();
}

bool ROB::isEmpty() const
{
    return count == 0;
}

int ROB::size() const
{
    return count;
}

int ROB::capacity() const
{
    return (int)entries.size();
}

int ROB::next(int robNum) const
{
    return (robNum + 1) % (int)entries.size();
}

int ROB::youngerCount(int robNum) const
{
    int cap = (int)entries.size();
    int offset = (robNum - head + cap) % cap;
    if (offset >= count)
        return 0;
    return count - offset - 1;
}

int ROB::addEntry(const Instruction &ins, int seq, int record)
{
    if (isFull())
        return -1;

    ROBEntry &e = entries[tail];
    clearEntry(tail);
    e.busy = true;
    e.state = RobState::ISSUED;
    e.op = ins.opcode;
    e.dest = ins.rd;
    e.nextIndex = ins.fallThrough();
    e.instrIndex = ins.index;
    e.seq = seq;
    e.record = record;

    int old_tail = tail;
    tail = next(tail);
    count++;

    return old_tail;
}

void ROB::markExecuting(int robNum)
{
    if (entries[robNum].busy && entries[robNum].state == RobState::ISSUED)
        entries[robNum].state = RobState::EXECUTING;
}

void ROB::markReady(const CompletedResult &res)
{
    ROBEntry &e = entries[res.robIndex];
    if (!e.busy || e.seq != res.seq)
        return;
    e.value = res.value;
    e.address = res.address;
    e.fault = res.fault;
    if (!e.resolvedAtIssue)
        e.nextIndex = res.nextIndex;
    e.state = RobState::WRITTEN;
}

void ROB::markResolvedAtIssue(int robNum, int nextIndex)
{
    entries[robNum].resolvedAtIssue = true;
    entries[robNum].nextIndex = nextIndex;
}

const ROBEntry &ROB::entry(int robNum) const
{
    return entries[robNum];
}

bool ROB::isLive(int robNum, int seq) const
{
    if (robNum < 0 || robNum >= (int)entries.size())
        return false;
    return entries[robNum].busy && entries[robNum].seq == seq;
}

bool ROB::commitHead(RegisterFile &regs, Memory &mem, ROBEntry &committed, int cycle)
{
    if (isEmpty())
        return false;

    ROBEntry &e = entries[head];
    if (!e.busy || e.state != RobState::WRITTEN)
        return false;

    if (e.op == Opcode::LOAD && e.fault)
    {
        throw MemoryBoundsError("LOAD address " + to_string(e.address) + " out of bounds",
                                e.address, e.instrIndex, cycle);
    }
    if (e.op == Opcode::STORE)
    {
        if (!mem.inBounds(e.address))
        {
            throw MemoryBoundsError("STORE address " + to_string(e.address) + " out of bounds",
                                    e.address, e.instrIndex, cycle);
        }
        mem.store(e.address, e.value);
    }
    else if (e.dest != NO_REG)
    {
        regs.write(e.dest, e.value);
        regs.clearTagIf(e.dest, head);
    }

    e.state = RobState::COMMITTED;
    committed = e;

    clearEntry(head);
    head = next(head);
    count--;
    return true;
}

vector<ROBEntry> ROB::squashFrom(int robNum, RegisterFile &regs)
{
    vector<ROBEntry> squashed;
    if (robNum < 0 || robNum >= (int)entries.size() || !entries[robNum].busy)
        return squashed;

    int cap = (int)entries.size();
    int offset = (robNum - head + cap) % cap;
    int n = count - offset;

    set<int> touched;
    for (int i = 0, idx = robNum; i < n; i++, idx = next(idx))
    {
        ROBEntry &e = entries[idx];
        if (e.dest != NO_REG && regs.clearTagIf(e.dest, idx))
            touched.insert(e.dest);
        squashed.push_back(e);
        clearEntry(idx);
    }
    tail = robNum;
    count -= n;

    // restore renaming for registers whose youngest producer was squashed
    if (!touched.empty())
    {
        for (int i = 0, k = head; i < count; i++, k = next(k))
        {
            const ROBEntry &e = entries[k];
            if (e.dest != NO_REG && touched.count(e.dest))
                regs.setTag(e.dest, k);
        }
    }
    return squashed;
}

bool ROB::hasOlderStore(int robNum) const
{
    for (int i = 0, k = head; i < count && k != robNum; i++, k = next(k))
    {
        if (entries[k].busy && entries[k].isStore())
            return true;
    }
    return false;
}

bool ROB::olderStoreConflicts(int robNum, int address) const
{
    for (int i = 0, k = head; i < count && k != robNum; i++, k = next(k))
    {
        const ROBEntry &e = entries[k];
        if (!e.busy || !e.isStore())
            continue;
        if (e.state != RobState::WRITTEN || e.address == address)
            return true;
    }
    return false;
}
