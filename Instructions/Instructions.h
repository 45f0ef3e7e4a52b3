#ifndef INSTRUCTIONS_H
#define INSTRUCTIONS_H
#include <string>
#include <map>
using namespace std;

enum class Opcode
{
    ADD,
    ADDI,
    NAND,
    MUL,
    LOAD,
    STORE,
    BEQ,
    CALL,
    RET
};

// Functional-unit classes; each owns one reservation station pool
enum class UnitClass
{
    ADD, // ADD and ADDI
    LOAD,
    STORE,
    NAND,
    MUL,
    BEQ,
    CALL_RET
};

const int UNIT_CLASS_COUNT = 7;
const int NO_REG = -1;
const int RETURN_REG = 1; // CALL links into R1, RET jumps through it

// Accepted range for immediates, displacements and branch offsets
const int IMM_MIN = -32768;
const int IMM_MAX = 65535;

inline int wrap16(long long x) { return (int)(x & 0xFFFF); }

string opcodeName(Opcode op);
bool opcodeFromName(const string &name, Opcode &op);
string unitClassName(UnitClass uc);
bool unitClassFromName(const string &name, UnitClass &uc);
UnitClass unitClassOf(Opcode op);

// One decoded instruction. Built once by the loader, then read-only.
class Instruction
{
public:
    Instruction();
    Instruction(int idx, Opcode op, int d, int s1, int s2, int imm);

    // Instruction fields
    int index;     // program-order position
    Opcode opcode;
    int rd;        // destination register (NO_REG if none)
    int rs1;       // source / base register
    int rs2;       // source / store data register
    int immediate; // ADDI immediate, memory displacement or control offset
    string text;

    UnitClass unitClass() const;
    bool writesRegister() const;
    bool isControl() const;
    int fallThrough() const;
    int branchTarget() const;

    void parse(const string &line, int idx, const map<string, int> &labels, int lineNo);

private:
    void parseArithmetic(const string &rest, int lineNo);
    void parseImmediate(const string &rest, int lineNo);
    void parseLoadStore(const string &rest, int lineNo);
    void parseBranch(const string &rest, const map<string, int> &labels, int lineNo);
    void parseCallReturn(const string &rest, const map<string, int> &labels, int lineNo);
};

#endif // INSTRUCTIONS_H
