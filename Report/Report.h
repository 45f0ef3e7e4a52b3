#ifndef REPORT_H
#define REPORT_H
#include "SchedulingEngine.h"
#include <ostream>
using namespace std;

// Per dynamic instruction: Issue / ExecS / ExecE / Write / Commit, '-' where absent
void printTimingTable(ostream &out, const vector<Instruction> &program,
                      const vector<InstrRecord> &records);
// Latest committed timing of each static instruction
void printStaticTiming(ostream &out, const SchedulingEngine &engine);
void printMachine(ostream &out, const SchedulingEngine &engine);
void printSummary(ostream &out, const RunStats &st, int programSize);
void printRegisters(ostream &out, const RegisterFile &regs);
// Non-zero words among the first `limit` addresses
void printMemory(ostream &out, const Memory &mem, int limit = 256);

void printReport(ostream &out, const SchedulingEngine &engine);

#endif // REPORT_H
