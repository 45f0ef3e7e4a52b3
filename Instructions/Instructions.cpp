#include "Instructions.h"
#include "SimErrors.h"
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
using namespace std;

static const pair<Opcode, const char *> OPCODE_NAMES[] = {
    {Opcode::ADD, "ADD"},
    {Opcode::ADDI, "ADDI"},
    {Opcode::NAND, "NAND"},
    {Opcode::MUL, "MUL"},
    {Opcode::LOAD, "LOAD"},
    {Opcode::STORE, "STORE"},
    {Opcode::BEQ, "BEQ"},
    {Opcode::CALL, "CALL"},
    {Opcode::RET, "RET"}};

static const pair<UnitClass, const char *> UNIT_NAMES[] = {
    {UnitClass::ADD, "ADD"},
    {UnitClass::LOAD, "LOAD"},
    {UnitClass::STORE, "STORE"},
    {UnitClass::NAND, "NAND"},
    {UnitClass::MUL, "MUL"},
    {UnitClass::BEQ, "BEQ"},
    {UnitClass::CALL_RET, "CALL_RET"}};

static string toUpper(string s)
{
    transform(s.begin(), s.end(), s.begin(),
              [](unsigned char c) { return toupper(c); });
    return s;
}

string opcodeName(Opcode op)
{
    for (auto &p : OPCODE_NAMES)
        if (p.first == op)
            return p.second;
    return "UNK";
}

bool opcodeFromName(const string &name, Opcode &op)
{
    string up = toUpper(name);
    for (auto &p : OPCODE_NAMES)
    {
        if (up == p.second)
        {
            op = p.first;
            return true;
        }
    }
    return false;
}

string unitClassName(UnitClass uc)
{
    for (auto &p : UNIT_NAMES)
        if (p.first == uc)
            return p.second;
    return "UNK";
}

bool unitClassFromName(const string &name, UnitClass &uc)
{
    string up = toUpper(name);
    if (up == "CALL/RET")
        up = "CALL_RET";
    for (auto &p : UNIT_NAMES)
    {
        if (up == p.second)
        {
            uc = p.first;
            return true;
        }
    }
    return false;
}

UnitClass unitClassOf(Opcode op)
{
    switch (op)
    {
    case Opcode::ADD:
    case Opcode::ADDI:
        return UnitClass::ADD;
    case Opcode::NAND:
        return UnitClass::NAND;
    case Opcode::MUL:
        return UnitClass::MUL;
    case Opcode::LOAD:
        return UnitClass::LOAD;
    case Opcode::STORE:
        return UnitClass::STORE;
    case Opcode::BEQ:
        return UnitClass::BEQ;
    case Opcode::CALL:
    case Opcode::RET:
        return UnitClass::CALL_RET;
    }
    return UnitClass::ADD;
}

// ---------------- token helpers ----------------

static vector<string> splitOperands(const string &rest)
{
    string s = rest;
    replace(s.begin(), s.end(), ',', ' ');
    stringstream ss(s);
    vector<string> out;
    string tok;
    while (ss >> tok)
        out.push_back(tok);
    return out;
}

static int parseRegister(const string &tok, int lineNo)
{
    if (tok.size() < 2 || (tok[0] != 'R' && tok[0] != 'r'))
        throw ParseError("Bad register '" + tok + "'", lineNo);
    for (size_t i = 1; i < tok.size(); ++i)
    {
        if (!isdigit((unsigned char)tok[i]))
            throw ParseError("Bad register '" + tok + "'", lineNo);
    }
    try
    {
        return stoi(tok.substr(1));
    }
    catch (const out_of_range &)
    {
        throw ParseError("Bad register '" + tok + "'", lineNo);
    }
}

static bool parseInt(const string &tok, int &value)
{
    if (tok.empty())
        return false;
    size_t i = (tok[0] == '-' || tok[0] == '+') ? 1 : 0;
    if (i == tok.size())
        return false;
    for (size_t j = i; j < tok.size(); ++j)
    {
        if (!isdigit((unsigned char)tok[j]))
            return false;
    }
    try
    {
        value = stoi(tok);
    }
    catch (const out_of_range &)
    {
        return false;
    }
    return true;
}

static bool parseImm(const string &tok, int &value)
{
    return parseInt(tok, value) && value >= IMM_MIN && value <= IMM_MAX;
}

static void expectCount(const vector<string> &ops, size_t n, const string &mnemonic, int lineNo)
{
    if (ops.size() != n)
    {
        throw ParseError(mnemonic + " expects " + to_string(n) + " operand(s), got " +
                             to_string(ops.size()),
                         lineNo);
    }
}

// ---------------- Instruction ----------------

Instruction::Instruction()
    : index(-1), opcode(Opcode::ADD), rd(NO_REG), rs1(NO_REG), rs2(NO_REG), immediate(0) {}

Instruction::Instruction(int idx, Opcode op, int d, int s1, int s2, int imm)
    : index(idx), opcode(op), rd(d), rs1(s1), rs2(s2), immediate(imm)
{
    text = opcodeName(op);
}

UnitClass Instruction::unitClass() const
{
    return unitClassOf(opcode);
}

bool Instruction::writesRegister() const
{
    return rd != NO_REG;
}

bool Instruction::isControl() const
{
    return opcode == Opcode::BEQ || opcode == Opcode::CALL || opcode == Opcode::RET;
}

int Instruction::fallThrough() const
{
    return index + 1;
}

int Instruction::branchTarget() const
{
    return index + 1 + immediate;
}

void Instruction::parse(const string &line, int idx, const map<string, int> &labels, int lineNo)
{
    index = idx;
    rd = rs1 = rs2 = NO_REG;
    immediate = 0;
    text = line;

    stringstream ss(line);
    string mnemonic;
    ss >> mnemonic;
    if (!opcodeFromName(mnemonic, opcode))
        throw ParseError("Unknown opcode '" + mnemonic + "'", lineNo);

    string rest;
    getline(ss, rest);

    switch (opcode)
    {
    case Opcode::ADD:
    case Opcode::NAND:
    case Opcode::MUL:
        parseArithmetic(rest, lineNo);
        break;
    case Opcode::ADDI:
        parseImmediate(rest, lineNo);
        break;
    case Opcode::LOAD:
    case Opcode::STORE:
        parseLoadStore(rest, lineNo);
        break;
    case Opcode::BEQ:
        parseBranch(rest, labels, lineNo);
        break;
    case Opcode::CALL:
    case Opcode::RET:
        parseCallReturn(rest, labels, lineNo);
        break;
    }
}

void Instruction::parseArithmetic(const string &rest, int lineNo)
{
    // ADD R1, R2, R3
    vector<string> ops = splitOperands(rest);
    expectCount(ops, 3, opcodeName(opcode), lineNo);
    rd = parseRegister(ops[0], lineNo);
    rs1 = parseRegister(ops[1], lineNo);
    rs2 = parseRegister(ops[2], lineNo);
}

void Instruction::parseImmediate(const string &rest, int lineNo)
{
    // ADDI R1, R2, imm
    vector<string> ops = splitOperands(rest);
    expectCount(ops, 3, "ADDI", lineNo);
    rd = parseRegister(ops[0], lineNo);
    rs1 = parseRegister(ops[1], lineNo);
    if (!parseImm(ops[2], immediate))
        throw ParseError("Bad immediate '" + ops[2] + "'", lineNo);
}

void Instruction::parseLoadStore(const string &rest, int lineNo)
{
    // LOAD R1, off(R2) / STORE R1, off(R2)
    vector<string> ops = splitOperands(rest);
    expectCount(ops, 2, opcodeName(opcode), lineNo);

    const string &mem = ops[1];
    size_t open = mem.find('(');
    size_t close = mem.find(')');
    if (open == string::npos || close == string::npos || close < open || close != mem.size() - 1)
        throw ParseError("Bad memory operand '" + mem + "'", lineNo);

    string disp = mem.substr(0, open);
    if (disp.empty())
        immediate = 0;
    else if (!parseImm(disp, immediate))
        throw ParseError("Bad displacement '" + disp + "'", lineNo);
    rs1 = parseRegister(mem.substr(open + 1, close - open - 1), lineNo);

    if (opcode == Opcode::LOAD)
        rd = parseRegister(ops[0], lineNo);
    else
        rs2 = parseRegister(ops[0], lineNo); // value to store
}

static int resolveTarget(const string &tok, int idx, const map<string, int> &labels, int lineNo)
{
    auto it = labels.find(tok);
    if (it != labels.end())
        return it->second - (idx + 1);
    int off = 0;
    if (!parseImm(tok, off))
        throw ParseError("Bad branch target '" + tok + "'", lineNo);
    return off;
}

void Instruction::parseBranch(const string &rest, const map<string, int> &labels, int lineNo)
{
    // BEQ R1, R2, offset|label
    vector<string> ops = splitOperands(rest);
    expectCount(ops, 3, "BEQ", lineNo);
    rs1 = parseRegister(ops[0], lineNo);
    rs2 = parseRegister(ops[1], lineNo);
    immediate = resolveTarget(ops[2], index, labels, lineNo);
}

void Instruction::parseCallReturn(const string &rest, const map<string, int> &labels, int lineNo)
{
    // CALL offset|label
    // RET
    vector<string> ops = splitOperands(rest);
    if (opcode == Opcode::RET)
    {
        expectCount(ops, 0, "RET", lineNo);
        rs1 = RETURN_REG;
    }
    else
    {
        expectCount(ops, 1, "CALL", lineNo);
        rd = RETURN_REG;
        immediate = resolveTarget(ops[0], index, labels, lineNo);
    }
}
