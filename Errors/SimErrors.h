#ifndef SIMERRORS_H
#define SIMERRORS_H
#include <stdexcept>
#include <string>
using namespace std;

// Fatal condition raised while the engine is running. Carries the cycle and
// the program index of the offending instruction (-1 when not known).
class SimulationError : public runtime_error
{
public:
    SimulationError(const string &msg, int instrIndex, int cycle)
        : runtime_error(msg), instrIndex(instrIndex), cycle(cycle) {}

    int instrIndex;
    int cycle;
};

class OperandError : public SimulationError
{
public:
    OperandError(const string &msg, int instrIndex, int cycle)
        : SimulationError(msg, instrIndex, cycle) {}
};

class MemoryBoundsError : public SimulationError
{
public:
    MemoryBoundsError(const string &msg, int address, int instrIndex = -1, int cycle = -1)
        : SimulationError(msg, instrIndex, cycle), address(address) {}

    int address;
};

// Malformed assembly line
class ParseError : public runtime_error
{
public:
    ParseError(const string &msg, int line)
        : runtime_error(msg), line(line) {}

    int line;
};

class ConfigError : public runtime_error
{
public:
    explicit ConfigError(const string &msg) : runtime_error(msg) {}
};

#endif // SIMERRORS_H
