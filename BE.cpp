#include <iostream>
#include <fstream>
#include <string>
#include <memory>
#include <iomanip>
#include <ctime>
#include <Eigen/Dense>
#include "ReadInput.h"
#include "MeanField.h"
#include "Fragmenting.h"
#include "Bootstrap.h"
#include "Solver.h"
#include "FCI.h"
#include "Functions.h"
#include "BEErrors.h"

int main(int argc, char* argv[])
{
    /* Read from the input */
    InputObj Input;
    if (argc == 3)
    {
        Input.SetNames(argv[1], argv[2]);
    }
    else if (argc == 2)
    {
        Input.SetNames(argv[1], "");
    }
    else
    {
        std::cerr << "Usage: " << argv[0] << " <input> [output]" << std::endl;
        return 1;
    }

    std::ofstream Output;
    try
    {
        Input.Set();
        if (Input.OutputName.empty()) Input.OutputName = Input.InputName + ".out";
        Output.open(Input.OutputName.c_str());
        if (!Output.is_open())
        {
            throw ConfigurationError("Cannot write output file " + Input.OutputName);
        }
        clock_t ClockStart = clock();

        MeanField MF;
        MF.InitFromInput(Input);
        MF.RunRHF(Output, Input.MaxSCF, Input.SCFTol);

        Fragmenting Frag = Input.MakeFragmenting();
        Frag.Generate(Input.Graph);
        Frag.PrintFrag(std::cout);
        Frag.PrintFrag(Output);

        Bootstrap BE;
        Input.ConfigureBootstrap(BE);
        BE.Init(MF, Frag.Frags, Output);
        if (!Input.RestartFile.empty())
        {
            BE.SetPotential(LoadPotential(Input.RestartFile, BE.CurrentPotential()));
            std::cout << "BE-DMET: Restarting from the potential in " << Input.RestartFile << std::endl;
            Output << "BE-DMET: Restarting from the potential in " << Input.RestartFile << std::endl;
        }

        std::unique_ptr< ImpuritySolver > Solver;
        if (Input.Solver == "hf") Solver.reset(new EmbeddedHF());
        else Solver.reset(new FCI());

        BEResult Result = BE.doBootstrap(*Solver);

        if (!Input.SavePotentialFile.empty()) SavePotential(Input.SavePotentialFile, Result.Potential);
        if (!Input.FCIDUMPPrefix.empty()) BE.ExportFCIDUMP(Input.FCIDUMPPrefix, Input.FCIDUMPMOBasis);

        std::cout << std::fixed << std::setprecision(10);
        std::cout << "BE-DMET: BE Energy = " << Result.Energy << " (" << StatusName(Result.Status) << " after " << Result.Iterations << " iterations)" << std::endl;
        Output << std::fixed << std::setprecision(10);
        Output << "BE-DMET: BE Energy = " << Result.Energy << " (" << StatusName(Result.Status) << " after " << Result.Iterations << " iterations)" << std::endl;
        std::cout << "BE-DMET: Total time = " << (double)(clock() - ClockStart) / CLOCKS_PER_SEC << " s" << std::endl;
    }
    catch (const BEError &Error)
    {
        std::cerr << "BE-DMET: Error: " << Error.what() << std::endl;
        if (Output.is_open()) Output << "BE-DMET: Error: " << Error.what() << std::endl;
        return 1;
    }
    return 0;
}
