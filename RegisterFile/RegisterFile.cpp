#include "RegisterFile.h"
#include "Instructions.h"

RegisterFile::RegisterFile(int count, bool zeroReg)
    : table(count > 0 ? count : 0), hardZero(zeroReg)
{
    for (auto &r : table)
    {
        r.value = 0;
        r.robTag = NO_TAG;
    }
}

int RegisterFile::size() const
{
    return (int)table.size();
}

bool RegisterFile::writable(int regNumber) const
{
    if (regNumber < 0 || regNumber >= (int)table.size())
        return false;
    return !(hardZero && regNumber == 0);
}

int RegisterFile::read(int regNumber) const
{
    if (regNumber >= 0 && regNumber < (int)table.size())
        return table[regNumber].value;
    return 0;
}

void RegisterFile::write(int regNumber, int value)
{
    if (writable(regNumber))
        table[regNumber].value = wrap16(value);
}

int RegisterFile::tag(int regNumber) const
{
    if (regNumber >= 0 && regNumber < (int)table.size())
        return table[regNumber].robTag;
    return NO_TAG;
}

void RegisterFile::setTag(int regNumber, int robTag)
{
    if (writable(regNumber))
        table[regNumber].robTag = robTag;
}

void RegisterFile::clearTag(int regNumber)
{
    if (regNumber >= 0 && regNumber < (int)table.size())
        table[regNumber].robTag = NO_TAG;
}

bool RegisterFile::clearTagIf(int regNumber, int robTag)
{
    if (robTag == NO_TAG || tag(regNumber) != robTag)
        return false;
    clearTag(regNumber);
    return true;
}
