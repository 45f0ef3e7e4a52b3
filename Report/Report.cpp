#include "Report.h"
#include <iomanip>
#include <string>

static string cell(int x)
{
    return x == -1 ? string("-") : to_string(x);
}

void printTimingTable(ostream &out, const vector<Instruction> &program,
                      const vector<InstrRecord> &records)
{
    out << left << setw(5) << "ID" << setw(6) << "PC" << setw(24) << "TEXT"
        << setw(8) << "Issue" << setw(8) << "ExecS" << setw(8) << "ExecE"
        << setw(8) << "Write" << setw(8) << "Commit" << "\n";
    for (auto &r : records)
    {
        const Instruction &ins = program[r.instrIndex];
        out << setw(5) << r.seq << setw(6) << r.instrIndex << setw(24) << ins.text
            << setw(8) << cell(r.issue) << setw(8) << cell(r.execStart) << setw(8) << cell(r.execEnd)
            << setw(8) << cell(r.write) << setw(8) << cell(r.commit);
        if (r.squashed)
            out << "squashed";
        out << "\n";
    }
    out << right;
}

void printStaticTiming(ostream &out, const SchedulingEngine &engine)
{
    const vector<Instruction> &program = engine.program();
    out << left << setw(6) << "PC" << setw(24) << "TEXT" << setw(8) << "Issue"
        << setw(8) << "ExecS" << setw(8) << "ExecE" << setw(8) << "Write" << setw(8) << "Commit" << "\n";
    for (size_t i = 0; i < program.size(); ++i)
    {
        out << setw(6) << i << setw(24) << program[i].text;
        const InstrRecord *r = engine.lastCommitted((int)i);
        if (r == nullptr)
            out << "not committed";
        else
            out << setw(8) << cell(r->issue) << setw(8) << cell(r->execStart) << setw(8) << cell(r->execEnd)
                << setw(8) << cell(r->write) << setw(8) << cell(r->commit);
        out << "\n";
    }
    out << right;
}

void printMachine(ostream &out, const SchedulingEngine &engine)
{
    const SimConfig &cfg = engine.config();
    out << "ROB " << engine.rob().capacity() << "  Registers " << cfg.registerCount
        << "  Memory " << cfg.memorySize << "  Issue " << cfg.issueWidth
        << "  Commit " << cfg.commitWidth << "\n";
    out << "Memory order " << memoryOrderName(cfg.memoryOrder)
        << "  Branch resolve " << branchResolveName(cfg.branchResolve) << "\n";
    for (int i = 0; i < UNIT_CLASS_COUNT; ++i)
    {
        UnitClass uc = static_cast<UnitClass>(i);
        out << "  " << left << setw(10) << unitClassName(uc) << right
            << cfg.unit(uc).slots << " stations, " << cfg.unit(uc).latency << " cycles\n";
    }
}

void printSummary(ostream &out, const RunStats &st, int programSize)
{
    out << "Cycles: " << st.cycles << "\n";
    out << fixed << setprecision(3) << "IPC: " << st.ipc() << "\n";
    out << "Instructions: " << programSize << "  Issued: " << st.issued
        << "  Committed: " << st.committed << "\n";
    out << "Branches: " << st.branches << "  Mispredictions: " << st.mispredictions
        << "  Squashed: " << st.squashed << "\n";
    out << "Stalls: ROB " << st.robStalls << "  RS " << st.rsStalls << "\n";
    if (st.hitCycleLimit)
        out << "Stopped at the cycle limit\n";
}

void printRegisters(ostream &out, const RegisterFile &regs)
{
    for (int i = 0; i < regs.size(); ++i)
        out << "R" << i << ":" << regs.read(i) << (i == regs.size() - 1 ? "\n" : "  ");
}

void printMemory(ostream &out, const Memory &mem, int limit)
{
    int printed = 0;
    for (int i = 0; i < limit && i < mem.size(); ++i)
    {
        int v = mem.load(i);
        if (v != 0)
        {
            out << "[" << i << "]=" << v << "  ";
            if (++printed % 8 == 0)
                out << "\n";
        }
    }
    if (printed == 0)
        out << "(none)";
    out << "\n";
}

void printReport(ostream &out, const SchedulingEngine &engine)
{
    out << "\n===== Simulation Results =====\n";
    printMachine(out, engine);
    out << "\n";
    printSummary(out, engine.stats(), (int)engine.program().size());
    out << "\n";
    printTimingTable(out, engine.program(), engine.records());
    out << "\nPer instruction (latest committed instance):\n";
    printStaticTiming(out, engine);
    out << "\nFinal registers:\n";
    printRegisters(out, engine.registers());
    out << "\nMemory nonzero values (first 256 addresses):\n";
    printMemory(out, engine.memory());
}
