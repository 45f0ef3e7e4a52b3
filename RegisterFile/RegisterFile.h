#ifndef REGISTERFILE_H
#define REGISTERFILE_H
#include <vector>
using namespace std;

const int NO_TAG = -1;

// Architectural register with its rename tag
struct RegEntry
{
    int value; // committed value
    int robTag; // ROB index of the youngest in-flight producer, NO_TAG if none
};

class RegisterFile
{
public:
    explicit RegisterFile(int count = 8, bool zeroReg = true);

    int size() const;

    int read(int regNumber) const;
    void write(int regNumber, int value);

    // Producer tag of a register, NO_TAG if the register is ready
    int tag(int regNumber) const;
    void setTag(int regNumber, int robTag);
    void clearTag(int regNumber);

    // Clear only if the register still names robTag (a younger issue may have retagged it)
    bool clearTagIf(int regNumber, int robTag);

private:
    bool writable(int regNumber) const;

    vector<RegEntry> table;
    bool hardZero;
};

#endif // REGISTERFILE_H
