#ifndef SIMCONFIG_H
#define SIMCONFIG_H
#include "Instructions.h"
#include <string>
#include <map>
#include <istream>
using namespace std;

// Load ordering against older, uncommitted stores
enum class MemoryOrder
{
    IN_ORDER, // wait until every older store has committed
    ADDRESS   // wait only on older stores with an unknown or equal address
};

enum class BranchResolve
{
    WRITE, // resolve at write-result, squash younger work on a mismatch
    ISSUE  // evaluate a BEQ with ready operands while issuing it
};

struct UnitShape
{
    int slots;
    int latency;
};

struct SimConfig
{
    int robSize = 8;
    int registerCount = 8; // R0..R7 (R0 == 0)
    int memorySize = 65536; // word-addressable
    int issueWidth = 1;
    int commitWidth = 1;
    int maxCycles = 1000000;
    bool zeroRegister = true;
    MemoryOrder memoryOrder = MemoryOrder::IN_ORDER;
    BranchResolve branchResolve = BranchResolve::WRITE;

    UnitShape units[UNIT_CLASS_COUNT];
    map<int, int> initRegs; // INIT_REG presets

    SimConfig();

    UnitShape &unit(UnitClass uc);
    const UnitShape &unit(UnitClass uc) const;

    // Throws ConfigError on a non-positive size or latency
    void validate() const;
};

// KEY value... lines, '#' comments. Throws ConfigError.
void parseConfig(istream &in, SimConfig &cfg);
SimConfig loadConfigFile(const string &fname);

string memoryOrderName(MemoryOrder mo);
string branchResolveName(BranchResolve br);

#endif // SIMCONFIG_H
