#ifndef SCHEDULINGENGINE_H
#define SCHEDULINGENGINE_H
#include "Instructions.h"
#include "RegisterFile.h"
#include "Memory.h"
#include "FunctionalUnit.h"
#include "ROB.h"
#include "SimConfig.h"
#include <vector>
#include <ostream>
using namespace std;

// Timing of one dynamic instance of an instruction; -1 marks a stage never reached
struct InstrRecord
{
    int instrIndex = -1;
    int seq = -1;
    int issue = -1;
    int execStart = -1;
    int execEnd = -1;
    int write = -1;
    int commit = -1;
    bool squashed = false;
    int squashCycle = -1;
};

struct RunStats
{
    int cycles = 0;
    int issued = 0;
    int committed = 0;
    int branches = 0;       // BEQs resolved
    int mispredictions = 0; // control instructions that redirected fetch
    int squashed = 0;       // instructions thrown away by those redirects
    int robStalls = 0;
    int rsStalls = 0;
    bool hitCycleLimit = false;

    double ipc() const { return cycles > 0 ? (double)committed / cycles : 0.0; }
};

// Tomasulo scheduler with a reorder buffer and fall-through speculation.
// Owns all machine state; one step() is one clock cycle.
class SchedulingEngine
{
public:
    SchedulingEngine(const vector<Instruction> &program, const SimConfig &cfg);

    // Per-event log ("Cycle N: ..."); nullptr disables it
    void setTrace(ostream *out);

    // Advance one cycle. Returns false once the machine is quiescent.
    // Throws OperandError / MemoryBoundsError on fatal conditions.
    bool step();
    RunStats run();

    bool isDone() const;
    bool fetchExhausted() const;
    int cycle() const;

    RegisterFile &registers();
    const RegisterFile &registers() const;
    Memory &memory();
    const Memory &memory() const;
    const ROB &rob() const;
    const FunctionalUnit &unit(UnitClass uc) const;
    const vector<Instruction> &program() const;
    const SimConfig &config() const;

    const vector<InstrRecord> &records() const;
    // Latest committed instance of a static instruction, nullptr if it never committed
    const InstrRecord *lastCommitted(int instrIndex) const;
    // Sequence numbers in commit order
    const vector<int> &commitOrder() const;
    const RunStats &stats() const;

private:
    void commitStage();
    void writeResultStage();
    void executeStage();
    void issueStage();
    bool issueOne();

    void checkRegister(int reg, const Instruction &ins) const;
    void readOperand(int reg, int &V, int &Q) const;
    void squashAfter(int robIndex, int redirect);
    bool mayStartLoad(const ReservationStation &rs) const;

    FunctionalUnit &unitFor(UnitClass uc);
    ostream *log() const;

    vector<Instruction> prog;
    SimConfig cfg;
    RegisterFile regs;
    Memory mem;
    vector<FunctionalUnit> units;
    ROB reorder;

    int pc;       // fetch cursor (program index)
    int cycleNum; // last completed cycle
    int nextSeq;

    vector<InstrRecord> recs;
    vector<int> commitSeqs;
    RunStats st;
    ostream *trace;
};

#endif // SCHEDULINGENGINE_H
