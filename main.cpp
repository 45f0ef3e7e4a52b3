// tomasulo_sim
// Tomasulo scheduler with a reorder buffer and branch speculation.
// Run: ./tomasulo_sim program.asm [memory.txt] [--config sim.cfg] [--trace]

#include "ProgramLoader.h"
#include "SchedulingEngine.h"
#include "SimConfig.h"
#include "SimErrors.h"
#include "Report.h"
#include <iostream>
#include <string>
#include <vector>
using namespace std;

static void usage(const char *argv0)
{
    cerr << "Usage: " << argv0 << " <program> [memory] [--config file] [--trace]\n";
}

int main(int argc, char *argv[])
{
    string progfile, memfile, cfgfile;
    bool traceOn = false;

    for (int i = 1; i < argc; ++i)
    {
        string arg = argv[i];
        if (arg == "--trace")
            traceOn = true;
        else if (arg == "--config" && i + 1 < argc)
            cfgfile = argv[++i];
        else if (arg == "-h" || arg == "--help")
        {
            usage(argv[0]);
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            usage(argv[0]);
            return 1;
        }
        else if (progfile.empty())
            progfile = arg;
        else if (memfile.empty())
            memfile = arg;
        else
        {
            usage(argv[0]);
            return 1;
        }
    }
    if (progfile.empty())
    {
        usage(argv[0]);
        return 1;
    }

    // -------------------- Configuration --------------------
    SimConfig cfg;
    vector<Instruction> program;
    try
    {
        if (!cfgfile.empty())
            cfg = loadConfigFile(cfgfile);
        cfg.validate();
        program = loadProgramFile(progfile);
    }
    catch (const ParseError &e)
    {
        cerr << progfile << ":" << e.line << ": " << e.what() << "\n";
        return 1;
    }
    catch (const exception &e)
    {
        cerr << e.what() << "\n";
        return 1;
    }

    SchedulingEngine engine(program, cfg);
    if (traceOn)
        engine.setTrace(&cout);

    // -------------------- Load memory (optional) --------------------
    if (!memfile.empty())
    {
        try
        {
            if (!loadMemoryFile(memfile, engine.memory()))
                cerr << "Warning: Could not open memory file: " << memfile << "\n";
        }
        catch (const ParseError &e)
        {
            cerr << memfile << ":" << e.line << ": " << e.what() << "\n";
            return 1;
        }
        catch (const MemoryBoundsError &e)
        {
            cerr << memfile << ": " << e.what() << "\n";
            return 1;
        }
    }

    // -------------------- Simulation loop --------------------
    int status = 0;
    try
    {
        engine.run();
    }
    catch (const SimulationError &e)
    {
        cerr << "Fatal: " << e.what() << " (cycle " << e.cycle << ", instruction " << e.instrIndex << ")\n";
        status = 1;
    }

    // -------------------- Print results --------------------
    printReport(cout, engine);
    if (engine.stats().hitCycleLimit)
        cerr << "Warning: stopped after " << engine.cycle() << " cycles\n";

    return status;
}
