#include "SchedulingEngine.h"
#include "SimErrors.h"
#include <algorithm>
#include <stdexcept>
#include <string>

SchedulingEngine::SchedulingEngine(const vector<Instruction> &program, const SimConfig &config)
    : prog(program),
      cfg(config),
      regs(config.registerCount, config.zeroRegister),
      mem(config.memorySize),
      reorder(config.robSize),
      pc(0),
      cycleNum(0),
      nextSeq(0),
      trace(nullptr)
{
    cfg.validate();
    for (int i = 0; i < UNIT_CLASS_COUNT; ++i)
    {
        UnitClass uc = static_cast<UnitClass>(i);
        units.emplace_back(uc, cfg.unit(uc).latency, cfg.unit(uc).slots);
    }
    for (auto &kv : cfg.initRegs)
        regs.write(kv.first, kv.second);
}

void SchedulingEngine::setTrace(ostream *out)
{
    trace = out;
}

ostream *SchedulingEngine::log() const
{
    return trace;
}

FunctionalUnit &SchedulingEngine::unitFor(UnitClass uc)
{
    return units[static_cast<int>(uc)];
}

// ---------------- Pipeline stages ----------------

// Retire from the ROB head, in allocation order only
void SchedulingEngine::commitStage()
{
    for (int w = 0; w < cfg.commitWidth; ++w)
    {
        ROBEntry e;
        if (!reorder.commitHead(regs, mem, e, cycleNum))
            return;

        recs[e.record].commit = cycleNum;
        st.committed++;
        commitSeqs.push_back(e.seq);
        if (log())
            *log() << "Cycle " << cycleNum << ": commit I" << e.instrIndex
                   << " (" << prog[e.instrIndex].text << ")\n";
    }
}

// Common data bus: every result finished in an earlier cycle is broadcast now
void SchedulingEngine::writeResultStage()
{
    vector<CompletedResult> done;
    for (auto &fu : units)
    {
        vector<CompletedResult> r = fu.takeFinished();
        done.insert(done.end(), r.begin(), r.end());
    }
    sort(done.begin(), done.end(),
         [](const CompletedResult &a, const CompletedResult &b) { return a.seq < b.seq; });

    for (auto &r : done)
    {
        // dropped by a squash earlier in this step
        if (!reorder.isLive(r.robIndex, r.seq))
            continue;

        for (auto &fu : units)
            fu.deliver(r.robIndex, r.value);
        reorder.markReady(r);

        const ROBEntry &e = reorder.entry(r.robIndex);
        recs[e.record].write = cycleNum;

        const Instruction &ins = prog[r.instrIndex];
        if (log())
            *log() << "Cycle " << cycleNum << ": write I" << ins.index
                   << " ROB" << r.robIndex << " = " << r.value << "\n";

        if (!ins.isControl() || e.resolvedAtIssue)
            continue;
        if (ins.opcode == Opcode::BEQ)
            st.branches++;
        if (r.nextIndex != ins.fallThrough())
        {
            st.mispredictions++;
            squashAfter(r.robIndex, r.nextIndex);
        }
    }
}

void SchedulingEngine::executeStage()
{
    for (auto &fu : units)
    {
        FunctionalUnit::StartGate gate;
        if (fu.getType() == UnitClass::LOAD)
            gate = [this](const ReservationStation &rs) { return mayStartLoad(rs); };

        TickEvents ev = fu.executeCycle(mem, gate);
        for (int r : ev.started)
        {
            reorder.markExecuting(r);
            InstrRecord &rec = recs[reorder.entry(r).record];
            rec.execStart = cycleNum;
            if (log())
                *log() << "Cycle " << cycleNum << ": start I" << rec.instrIndex << "\n";
        }
        for (int r : ev.finished)
        {
            InstrRecord &rec = recs[reorder.entry(r).record];
            rec.execEnd = cycleNum;
            if (log())
                *log() << "Cycle " << cycleNum << ": finish I" << rec.instrIndex << "\n";
        }
    }
}

bool SchedulingEngine::mayStartLoad(const ReservationStation &rs) const
{
    if (cfg.memoryOrder == MemoryOrder::IN_ORDER)
        return !reorder.hasOlderStore(rs.Dest);
    return !reorder.olderStoreConflicts(rs.Dest, rs.A);
}

void SchedulingEngine::issueStage()
{
    for (int w = 0; w < cfg.issueWidth; ++w)
    {
        if (!issueOne())
            return;
    }
}

void SchedulingEngine::checkRegister(int reg, const Instruction &ins) const
{
    if (reg == NO_REG)
        return;
    if (reg < 0 || reg >= regs.size())
    {
        throw OperandError("register R" + to_string(reg) + " out of range in '" + ins.text + "'",
                           ins.index, cycleNum);
    }
}

// Register value, a forwarded ROB value, or the producer tag
void SchedulingEngine::readOperand(int reg, int &V, int &Q) const
{
    int t = regs.tag(reg);
    if (t == NO_TAG)
    {
        V = regs.read(reg);
        Q = NO_TAG;
        return;
    }
    const ROBEntry &e = reorder.entry(t);
    if (e.state == RobState::WRITTEN)
    {
        V = e.value;
        Q = NO_TAG;
    }
    else
    {
        V = 0;
        Q = t;
    }
}

bool SchedulingEngine::issueOne()
{
    if (fetchExhausted())
        return false;

    const Instruction &ins = prog[pc];
    checkRegister(ins.rd, ins);
    checkRegister(ins.rs1, ins);
    checkRegister(ins.rs2, ins);

    // structural hazards: take both a ROB entry and a station, or neither
    FunctionalUnit &fu = unitFor(ins.unitClass());
    if (reorder.isFull())
    {
        st.robStalls++;
        if (log())
            *log() << "Cycle " << cycleNum << ": stall I" << ins.index << " (ROB full)\n";
        return false;
    }
    if (!fu.freeRS())
    {
        st.rsStalls++;
        if (log())
            *log() << "Cycle " << cycleNum << ": stall I" << ins.index << " (no free "
                   << unitClassName(fu.getType()) << " station)\n";
        return false;
    }

    int Vj = 0, Vk = 0, Qj = NO_TAG, Qk = NO_TAG;
    int A = 0, Qa = NO_TAG;
    int base = 0;
    switch (ins.opcode)
    {
    case Opcode::ADD:
    case Opcode::NAND:
    case Opcode::MUL:
    case Opcode::BEQ:
        readOperand(ins.rs1, Vj, Qj);
        readOperand(ins.rs2, Vk, Qk);
        break;
    case Opcode::ADDI:
        readOperand(ins.rs1, Vj, Qj);
        Vk = ins.immediate;
        break;
    case Opcode::LOAD:
        readOperand(ins.rs1, base, Qa);
        A = (Qa == NO_TAG) ? base + ins.immediate : ins.immediate;
        break;
    case Opcode::STORE:
        readOperand(ins.rs2, Vj, Qj); // data
        readOperand(ins.rs1, base, Qa);
        A = (Qa == NO_TAG) ? base + ins.immediate : ins.immediate;
        break;
    case Opcode::CALL:
        break;
    case Opcode::RET:
        readOperand(ins.rs1, Vj, Qj);
        break;
    }

    int record = (int)recs.size();
    int robIdx = reorder.addEntry(ins, nextSeq, record);
    if (robIdx == -1 || fu.allocate(ins, Vj, Vk, Qj, Qk, A, Qa, robIdx, nextSeq) == -1)
        throw logic_error("issue lost a checked ROB entry or station");

    InstrRecord rec;
    rec.instrIndex = ins.index;
    rec.seq = nextSeq;
    rec.issue = cycleNum;
    recs.push_back(rec);
    nextSeq++;
    st.issued++;

    // rename after reading sources (ADD R1, R1, R2 reads the old R1)
    if (ins.writesRegister())
        regs.setTag(ins.rd, robIdx);

    if (log())
        *log() << "Cycle " << cycleNum << ": issue I" << ins.index << " (" << ins.text
               << ") -> ROB" << robIdx << "\n";

    int nextPc = ins.fallThrough();
    if (ins.opcode == Opcode::BEQ && cfg.branchResolve == BranchResolve::ISSUE &&
        Qj == NO_TAG && Qk == NO_TAG)
    {
        nextPc = (Vj == Vk) ? ins.branchTarget() : ins.fallThrough();
        reorder.markResolvedAtIssue(robIdx, nextPc);
        st.branches++;
        if (log())
            *log() << "Cycle " << cycleNum << ": BEQ I" << ins.index << " resolved at issue, fetch -> "
                   << nextPc << "\n";
    }
    pc = nextPc;
    return true;
}

// Throw away everything younger than robIndex and restart fetch at redirect
void SchedulingEngine::squashAfter(int robIndex, int redirect)
{
    vector<int> gone;
    if (reorder.youngerCount(robIndex) > 0)
    {
        int from = reorder.next(robIndex);
        vector<ROBEntry> squashed = reorder.squashFrom(from, regs);
        int idx = from;
        for (auto &e : squashed)
        {
            recs[e.record].squashed = true;
            recs[e.record].squashCycle = cycleNum;
            gone.push_back(idx);
            idx = reorder.next(idx);
        }
        for (auto &fu : units)
            fu.squash(gone);
        st.squashed += (int)squashed.size();
    }

    if (log())
        *log() << "Cycle " << cycleNum << ": I" << reorder.entry(robIndex).instrIndex
               << " mispredicted, squashed " << gone.size() << ", fetch -> " << redirect << "\n";
    pc = redirect;
}

// ---------------- Driver ----------------

bool SchedulingEngine::step()
{
    if (isDone())
        return false;

    ++cycleNum;
    commitStage();
    writeResultStage();
    executeStage();
    issueStage();

    st.cycles = cycleNum;
    return true;
}

RunStats SchedulingEngine::run()
{
    while (!isDone())
    {
        if (cycleNum >= cfg.maxCycles)
        {
            st.hitCycleLimit = true;
            if (log())
                *log() << "Cycle " << cycleNum << ": cycle limit reached\n";
            break;
        }
        step();
    }
    return st;
}

bool SchedulingEngine::fetchExhausted() const
{
    return pc < 0 || pc >= (int)prog.size();
}

bool SchedulingEngine::isDone() const
{
    return fetchExhausted() && reorder.isEmpty();
}

int SchedulingEngine::cycle() const
{
    return cycleNum;
}

RegisterFile &SchedulingEngine::registers()
{
    return regs;
}

const RegisterFile &SchedulingEngine::registers() const
{
    return regs;
}

Memory &SchedulingEngine::memory()
{
    return mem;
}

const Memory &SchedulingEngine::memory() const
{
    return mem;
}

const ROB &SchedulingEngine::rob() const
{
    return reorder;
}

const FunctionalUnit &SchedulingEngine::unit(UnitClass uc) const
{
    return units[static_cast<int>(uc)];
}

const vector<Instruction> &SchedulingEngine::program() const
{
    return prog;
}

const SimConfig &SchedulingEngine::config() const
{
    return cfg;
}

const vector<InstrRecord> &SchedulingEngine::records() const
{
    return recs;
}

const InstrRecord *SchedulingEngine::lastCommitted(int instrIndex) const
{
    for (auto it = recs.rbegin(); it != recs.rend(); ++it)
    {
        if (it->instrIndex == instrIndex && it->commit != -1)
            return &*it;
    }
    return nullptr;
}

const vector<int> &SchedulingEngine::commitOrder() const
{
    return commitSeqs;
}

const RunStats &SchedulingEngine::stats() const
{
    return st;
}
