#include "ProgramLoader.h"
#include "Memory.h"
#include "SimErrors.h"
#include <fstream>
#include <sstream>
#include <map>
#include <cctype>

static string trim(const string &s)
{
    size_t a = 0;
    while (a < s.size() && isspace((unsigned char)s[a]))
        ++a;
    size_t b = s.size();
    while (b > a && isspace((unsigned char)s[b - 1]))
        --b;
    return s.substr(a, b - a);
}

static string stripComment(string line)
{
    size_t p = line.find('#');
    if (p != string::npos)
        line = line.substr(0, p);
    p = line.find("//");
    if (p != string::npos)
        line = line.substr(0, p);
    return trim(line);
}

static bool isLabelName(const string &s)
{
    if (s.empty() || !(isalpha((unsigned char)s[0]) || s[0] == '_'))
        return false;
    for (char c : s)
    {
        if (!(isalnum((unsigned char)c) || c == '_'))
            return false;
    }
    return true;
}

struct SourceLine
{
    string text;
    int lineNo;
};

vector<Instruction> parseProgram(istream &in)
{
    // first pass: strip comments, collect labels
    vector<SourceLine> lines;
    map<string, int> labels;
    string line;
    int lineNo = 0;
    while (getline(in, line))
    {
        ++lineNo;
        line = stripComment(line);
        while (!line.empty())
        {
            size_t colon = line.find(':');
            if (colon == string::npos)
                break;
            string name = trim(line.substr(0, colon));
            if (!isLabelName(name))
                throw ParseError("Bad label '" + name + "'", lineNo);
            if (labels.count(name))
                throw ParseError("Duplicate label '" + name + "'", lineNo);
            labels[name] = (int)lines.size();
            line = trim(line.substr(colon + 1));
        }
        if (line.empty())
            continue;
        lines.push_back({line, lineNo});
    }

    // second pass: decode
    vector<Instruction> program;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        Instruction ins;
        ins.parse(lines[i].text, (int)i, labels, lines[i].lineNo);
        program.push_back(ins);
    }
    return program;
}

vector<Instruction> loadProgramFile(const string &fname)
{
    ifstream f(fname);
    if (!f)
        throw runtime_error("Cannot open program file: " + fname);
    return parseProgram(f);
}

void parseMemory(istream &in, Memory &mem)
{
    string line;
    int lineNo = 0;
    while (getline(in, line))
    {
        ++lineNo;
        line = stripComment(line);
        if (line.empty())
            continue;
        istringstream iss(line);
        int addr, val;
        if (!(iss >> addr >> val))
            throw ParseError("Bad memory line: " + line, lineNo);
        if (!mem.inBounds(addr))
            throw MemoryBoundsError("Memory image address " + to_string(addr) + " out of bounds", addr);
        mem.store(addr, val);
    }
}

bool loadMemoryFile(const string &fname, Memory &mem)
{
    ifstream f(fname);
    if (!f)
    {
        // not fatal: memory stays zero
        return false;
    }
    parseMemory(f, mem);
    return true;
}
