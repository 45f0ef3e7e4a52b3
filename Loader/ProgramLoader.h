#ifndef PROGRAMLOADER_H
#define PROGRAMLOADER_H
#include "Instructions.h"
#include <vector>
#include <string>
#include <istream>
using namespace std;

class Memory;

// Assembly text: one instruction per line, "label:" prefixes, '#' or "//" comments.
// Throws ParseError with the offending line number.
vector<Instruction> parseProgram(istream &in);
vector<Instruction> loadProgramFile(const string &fname);

// "address value" lines. Returns false if the file cannot be opened (memory stays zero).
void parseMemory(istream &in, Memory &mem);
bool loadMemoryFile(const string &fname, Memory &mem);

#endif // PROGRAMLOADER_H
