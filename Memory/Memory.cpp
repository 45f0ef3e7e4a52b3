#include "Memory.h"
#include "SimErrors.h"
#include "Instructions.h"
#include <string>

Memory::Memory(int size) : data(size > 0 ? size : 0, 0) {}

bool Memory::inBounds(int address) const
{
    return address >= 0 && address < (int)data.size();
}

int Memory::load(int address) const
{
    if (!inBounds(address))
    {
        throw MemoryBoundsError("Address " + to_string(address) + " out of bounds", address);
    }
    return data[address];
}

void Memory::store(int address, int value)
{
    if (!inBounds(address))
    {
        throw MemoryBoundsError("Address " + to_string(address) + " out of bounds", address);
    }
    data[address] = wrap16(value);
}

int Memory::size() const
{
    return (int)data.size();
}
