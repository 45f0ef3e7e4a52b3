#include "SimConfig.h"
#include "SimErrors.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

SimConfig::SimConfig()
{
    // slots, exec latency
    unit(UnitClass::ADD) = {4, 2}; // covers ADD/ADDI
    unit(UnitClass::LOAD) = {2, 6};
    unit(UnitClass::STORE) = {1, 6};
    unit(UnitClass::NAND) = {2, 2};
    unit(UnitClass::MUL) = {1, 8};
    unit(UnitClass::BEQ) = {2, 1};
    unit(UnitClass::CALL_RET) = {2, 4};
}

UnitShape &SimConfig::unit(UnitClass uc)
{
    return units[static_cast<int>(uc)];
}

const UnitShape &SimConfig::unit(UnitClass uc) const
{
    return units[static_cast<int>(uc)];
}

void SimConfig::validate() const
{
    if (robSize <= 0)
        throw ConfigError("ROB size must be positive");
    if (registerCount <= RETURN_REG)
        throw ConfigError("at least " + to_string(RETURN_REG + 1) + " registers are required");
    if (memorySize <= 0)
        throw ConfigError("memory size must be positive");
    if (issueWidth <= 0 || commitWidth <= 0)
        throw ConfigError("issue and commit width must be positive");
    if (maxCycles <= 0)
        throw ConfigError("cycle limit must be positive");
    for (int i = 0; i < UNIT_CLASS_COUNT; ++i)
    {
        string name = unitClassName(static_cast<UnitClass>(i));
        if (units[i].slots <= 0)
            throw ConfigError(name + " needs at least one reservation station");
        if (units[i].latency <= 0)
            throw ConfigError(name + " latency must be positive");
    }
    for (auto &kv : initRegs)
    {
        if (kv.first < 0 || kv.first >= registerCount)
            throw ConfigError("INIT_REG R" + to_string(kv.first) + " out of range");
    }
}

string memoryOrderName(MemoryOrder mo)
{
    return mo == MemoryOrder::IN_ORDER ? "INORDER" : "ADDRESS";
}

string branchResolveName(BranchResolve br)
{
    return br == BranchResolve::WRITE ? "WRITE" : "ISSUE";
}

static string toUpper(string s)
{
    transform(s.begin(), s.end(), s.begin(),
              [](unsigned char c) { return toupper(c); });
    return s;
}

static int readInt(stringstream &ss, const string &key, int lineNo)
{
    int v;
    if (!(ss >> v))
        throw ConfigError("line " + to_string(lineNo) + ": " + key + " expects an integer");
    return v;
}

void parseConfig(istream &in, SimConfig &cfg)
{
    string line;
    int lineNo = 0;
    while (getline(in, line))
    {
        ++lineNo;
        size_t p = line.find('#');
        if (p != string::npos)
            line = line.substr(0, p);

        stringstream ss(line);
        string token;
        if (!(ss >> token))
            continue;
        string key = toUpper(token);

        if (key == "ROB")
            cfg.robSize = readInt(ss, key, lineNo);
        else if (key == "REGISTERS")
            cfg.registerCount = readInt(ss, key, lineNo);
        else if (key == "MEMORY")
            cfg.memorySize = readInt(ss, key, lineNo);
        else if (key == "ISSUE_WIDTH")
            cfg.issueWidth = readInt(ss, key, lineNo);
        else if (key == "COMMIT_WIDTH")
            cfg.commitWidth = readInt(ss, key, lineNo);
        else if (key == "MAX_CYCLES")
            cfg.maxCycles = readInt(ss, key, lineNo);
        else if (key == "ZERO_REGISTER")
            cfg.zeroRegister = readInt(ss, key, lineNo) != 0;
        else if (key == "MEMORY_ORDER")
        {
            string v;
            ss >> v;
            v = toUpper(v);
            if (v == "INORDER")
                cfg.memoryOrder = MemoryOrder::IN_ORDER;
            else if (v == "ADDRESS")
                cfg.memoryOrder = MemoryOrder::ADDRESS;
            else
                throw ConfigError("line " + to_string(lineNo) + ": unknown memory order '" + v + "'");
        }
        else if (key == "BRANCH_RESOLVE")
        {
            string v;
            ss >> v;
            v = toUpper(v);
            if (v == "WRITE")
                cfg.branchResolve = BranchResolve::WRITE;
            else if (v == "ISSUE")
                cfg.branchResolve = BranchResolve::ISSUE;
            else
                throw ConfigError("line " + to_string(lineNo) + ": unknown branch policy '" + v + "'");
        }
        else if (key == "UNIT")
        {
            // UNIT <class> <slots> <latency>
            string name;
            ss >> name;
            UnitClass uc;
            if (!unitClassFromName(name, uc))
                throw ConfigError("line " + to_string(lineNo) + ": unknown unit '" + name + "'");
            UnitShape &u = cfg.unit(uc);
            u.slots = readInt(ss, key, lineNo);
            u.latency = readInt(ss, key, lineNo);
        }
        else if (key == "INIT_REG")
        {
            string r;
            ss >> r;
            if (r.size() < 2 || toupper((unsigned char)r[0]) != 'R')
                throw ConfigError("line " + to_string(lineNo) + ": bad register '" + r + "'");
            int idx;
            try
            {
                idx = stoi(r.substr(1));
            }
            catch (const exception &)
            {
                throw ConfigError("line " + to_string(lineNo) + ": bad register '" + r + "'");
            }
            cfg.initRegs[idx] = readInt(ss, key, lineNo);
        }
        else
        {
            throw ConfigError("line " + to_string(lineNo) + ": unknown key '" + token + "'");
        }
    }
}

SimConfig loadConfigFile(const string &fname)
{
    ifstream f(fname);
    if (!f)
        throw ConfigError("Cannot open config file: " + fname);
    SimConfig cfg;
    parseConfig(f, cfg);
    cfg.validate();
    return cfg;
}
