#include "ROB.h"
#include "RegisterFile.h"
#include "Memory.h"
#include "SimErrors.h"
#include <gtest/gtest.h>

namespace
{
CompletedResult resultFor(int robIndex, int seq, int value, int address = -1)
{
    CompletedResult r = CompletedResult();
    r.robIndex = robIndex;
    r.seq = seq;
    r.value = value;
    r.address = address;
    r.nextIndex = -1;
    return r;
}
}

TEST(ROBTest, AllocateFailsWhenFull)
{
    ROB rob(2);
    Instruction add(0, Opcode::ADDI, 1, 0, NO_REG, 1);
    EXPECT_TRUE(rob.isEmpty());
    EXPECT_EQ(rob.addEntry(add, 0, 0), 0);
    EXPECT_EQ(rob.addEntry(add, 1, 1), 1);
    EXPECT_TRUE(rob.isFull());
    EXPECT_EQ(rob.addEntry(add, 2, 2), -1);
    EXPECT_EQ(rob.size(), 2);
    EXPECT_EQ(rob.capacity(), 2);
    EXPECT_EQ(rob.entry(0).seq, 0);
    EXPECT_EQ(rob.entry(0).state, RobState::ISSUED);
}

TEST(ROBTest, CommitsOnlyFromHead)
{
    ROB rob(4);
    RegisterFile regs(8);
    Memory mem(16);
    Instruction a(0, Opcode::ADDI, 1, 0, NO_REG, 1);
    Instruction b(1, Opcode::ADDI, 2, 0, NO_REG, 2);
    int ra = rob.addEntry(a, 0, 0);
    int rb = rob.addEntry(b, 1, 1);
    regs.setTag(1, ra);
    regs.setTag(2, rb);

    // younger entry written first
    rob.markReady(resultFor(rb, 1, 22));
    ROBEntry out;
    EXPECT_FALSE(rob.commitHead(regs, mem, out, 1));
    EXPECT_EQ(regs.read(2), 0);

    rob.markReady(resultFor(ra, 0, 11));
    ASSERT_TRUE(rob.commitHead(regs, mem, out, 2));
    EXPECT_EQ(out.instrIndex, 0);
    EXPECT_EQ(out.state, RobState::COMMITTED);
    EXPECT_EQ(regs.read(1), 11);
    EXPECT_EQ(regs.tag(1), NO_TAG);

    ASSERT_TRUE(rob.commitHead(regs, mem, out, 3));
    EXPECT_EQ(out.instrIndex, 1);
    EXPECT_EQ(regs.read(2), 22);
    EXPECT_TRUE(rob.isEmpty());
}

TEST(ROBTest, CommitKeepsYoungerRename)
{
    ROB rob(4);
    RegisterFile regs(8);
    Memory mem(16);
    Instruction a(0, Opcode::ADDI, 1, 0, NO_REG, 1);
    Instruction b(1, Opcode::ADDI, 1, 0, NO_REG, 2);
    int ra = rob.addEntry(a, 0, 0);
    regs.setTag(1, ra);
    int rb = rob.addEntry(b, 1, 1);
    regs.setTag(1, rb);

    rob.markReady(resultFor(ra, 0, 1));
    ROBEntry out;
    ASSERT_TRUE(rob.commitHead(regs, mem, out, 1));
    EXPECT_EQ(regs.read(1), 1);
    EXPECT_EQ(regs.tag(1), rb);
}

TEST(ROBTest, StoreWritesMemoryAtCommit)
{
    ROB rob(4);
    RegisterFile regs(8);
    Memory mem(16);
    Instruction st(0, Opcode::STORE, NO_REG, 0, 3, 5);
    int r = rob.addEntry(st, 0, 0);
    rob.markReady(resultFor(r, 0, 77, 5));
    EXPECT_EQ(mem.load(5), 0);

    ROBEntry out;
    ASSERT_TRUE(rob.commitHead(regs, mem, out, 1));
    EXPECT_EQ(mem.load(5), 77);
}

TEST(ROBTest, OutOfRangeStoreFailsAtCommit)
{
    ROB rob(4);
    RegisterFile regs(8);
    Memory mem(16);
    Instruction st(3, Opcode::STORE, NO_REG, 0, 3, 40);
    int r = rob.addEntry(st, 0, 0);
    rob.markReady(resultFor(r, 0, 1, 40));

    ROBEntry out;
    try
    {
        rob.commitHead(regs, mem, out, 9);
        FAIL() << "expected MemoryBoundsError";
    }
    catch (const MemoryBoundsError &e)
    {
        EXPECT_EQ(e.address, 40);
        EXPECT_EQ(e.instrIndex, 3);
        EXPECT_EQ(e.cycle, 9);
    }
}

TEST(ROBTest, FaultingLoadFailsAtCommit)
{
    ROB rob(4);
    RegisterFile regs(8);
    Memory mem(16);
    int r = rob.addEntry(Instruction(0, Opcode::LOAD, 2, 0, NO_REG, 99), 0, 0);
    CompletedResult res = resultFor(r, 0, 0, 99);
    res.fault = true;
    rob.markReady(res);

    ROBEntry out;
    EXPECT_THROW(rob.commitHead(regs, mem, out, 1), MemoryBoundsError);
}

TEST(ROBTest, SquashRestoresYoungestSurvivingProducer)
{
    ROB rob(4);
    RegisterFile regs(8);
    int a = rob.addEntry(Instruction(0, Opcode::ADDI, 1, 0, NO_REG, 1), 0, 0);
    regs.setTag(1, a);
    int b = rob.addEntry(Instruction(1, Opcode::ADDI, 1, 0, NO_REG, 2), 1, 1);
    regs.setTag(1, b);
    int br = rob.addEntry(Instruction(2, Opcode::BEQ, NO_REG, 0, 0, 4), 2, 2);
    int d = rob.addEntry(Instruction(3, Opcode::ADDI, 1, 0, NO_REG, 3), 3, 3);
    regs.setTag(1, d);
    EXPECT_TRUE(rob.isFull());
    EXPECT_EQ(rob.youngerCount(br), 1);

    vector<ROBEntry> gone = rob.squashFrom(rob.next(br), regs);
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone[0].instrIndex, 3);
    EXPECT_EQ(rob.size(), 3);
    EXPECT_EQ(regs.tag(1), b);
    EXPECT_FALSE(rob.isLive(d, 3));
    EXPECT_TRUE(rob.isLive(br, 2));

    // the freed slot is reused by the next allocation
    EXPECT_EQ(rob.addEntry(Instruction(5, Opcode::ADDI, 2, 0, NO_REG, 0), 4, 4), d);
}

TEST(ROBTest, SquashLeavesOlderEntriesUntouched)
{
    ROB rob(4);
    RegisterFile regs(8);
    int a = rob.addEntry(Instruction(0, Opcode::ADDI, 1, 0, NO_REG, 1), 0, 0);
    regs.setTag(1, a);
    rob.markReady(resultFor(a, 0, 1));
    int b = rob.addEntry(Instruction(1, Opcode::ADDI, 2, 0, NO_REG, 2), 1, 1);
    regs.setTag(2, b);
    int c = rob.addEntry(Instruction(2, Opcode::ADDI, 1, 0, NO_REG, 3), 2, 2);
    regs.setTag(1, c);

    vector<ROBEntry> gone = rob.squashFrom(b, regs);
    EXPECT_EQ(gone.size(), 2u);
    EXPECT_EQ(rob.size(), 1);
    EXPECT_EQ(regs.tag(1), a);
    EXPECT_EQ(regs.tag(2), NO_TAG);
    EXPECT_EQ(rob.entry(a).state, RobState::WRITTEN);
    EXPECT_EQ(rob.entry(a).value, 1);
}

TEST(ROBTest, SquashAcrossWrapAround)
{
    ROB rob(3);
    RegisterFile regs(8);
    Memory mem(8);
    ROBEntry out;

    // advance head to slot 2
    for (int i = 0; i < 2; ++i)
    {
        int r = rob.addEntry(Instruction(i, Opcode::ADDI, 3, 0, NO_REG, 0), i, i);
        rob.markReady(resultFor(r, i, 0));
        ASSERT_TRUE(rob.commitHead(regs, mem, out, i + 1));
    }
    int x = rob.addEntry(Instruction(2, Opcode::BEQ, NO_REG, 0, 0, 1), 2, 2);
    int y = rob.addEntry(Instruction(3, Opcode::ADDI, 4, 0, NO_REG, 1), 3, 3);
    regs.setTag(4, y);
    int z = rob.addEntry(Instruction(4, Opcode::ADDI, 5, 0, NO_REG, 1), 4, 4);
    regs.setTag(5, z);
    EXPECT_EQ(x, 2);
    EXPECT_EQ(y, 0);
    EXPECT_EQ(z, 1);
    EXPECT_EQ(rob.youngerCount(x), 2);
    EXPECT_EQ(rob.youngerCount(z), 0);

    vector<ROBEntry> gone = rob.squashFrom(rob.next(x), regs);
    EXPECT_EQ(gone.size(), 2u);
    EXPECT_EQ(rob.size(), 1);
    EXPECT_EQ(regs.tag(4), NO_TAG);
    EXPECT_EQ(regs.tag(5), NO_TAG);
}

TEST(ROBTest, LoadOrderingQueries)
{
    ROB rob(4);
    int s = rob.addEntry(Instruction(0, Opcode::STORE, NO_REG, 0, 1, 5), 0, 0);
    int l = rob.addEntry(Instruction(1, Opcode::LOAD, 2, 0, NO_REG, 6), 1, 1);

    EXPECT_TRUE(rob.hasOlderStore(l));
    EXPECT_FALSE(rob.hasOlderStore(s));
    // address unknown until the store writes
    EXPECT_TRUE(rob.olderStoreConflicts(l, 6));

    rob.markReady(resultFor(s, 0, 9, 5));
    EXPECT_FALSE(rob.olderStoreConflicts(l, 6));
    EXPECT_TRUE(rob.olderStoreConflicts(l, 5));
    EXPECT_TRUE(rob.hasOlderStore(l));
}
