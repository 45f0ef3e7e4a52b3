#ifndef MEMORY_H
#define MEMORY_H
#include <vector>
using namespace std;

// Flat word-addressable data memory (16-bit words)
class Memory
{
public:
    explicit Memory(int size);

    int load(int address) const;
    void store(int address, int value);

    bool inBounds(int address) const;
    int size() const;

private:
    vector<int> data;
};

#endif // MEMORY_H
