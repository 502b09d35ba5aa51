#include <iostream>
#include <vector>
#include <string>
#include <fstream>
#include <sstream>
#include <map>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "ReadInput.h"
#include "Functions.h"
#include "BEErrors.h"

void InputObj::SetNames(std::string Input, std::string Out)
{
    InputName = Input;
    OutputName = Out;
}

static std::string AtLine(int LineNumber)
{
    return "Input line " + std::to_string(LineNumber) + ": ";
}

static double ToDouble(const std::string &Token, int LineNumber)
{
    try
    {
        size_t Used;
        double Value = std::stod(Token, &Used);
        if (Used != Token.size()) throw std::invalid_argument(Token);
        return Value;
    }
    catch (const std::logic_error&)
    {
        throw ConfigurationError(AtLine(LineNumber) + "expected a number, got \"" + Token + "\"");
    }
}

static int ToInt(const std::string &Token, int LineNumber)
{
    try
    {
        size_t Used;
        int Value = std::stoi(Token, &Used);
        if (Used != Token.size()) throw std::invalid_argument(Token);
        return Value;
    }
    catch (const std::logic_error&)
    {
        throw ConfigurationError(AtLine(LineNumber) + "expected an integer, got \"" + Token + "\"");
    }
}

static bool ToBool(const std::string &Token, int LineNumber)
{
    if (Token == "1" || Token == "true" || Token == "on" || Token == "yes") return true;
    if (Token == "0" || Token == "false" || Token == "off" || Token == "no") return false;
    throw ConfigurationError(AtLine(LineNumber) + "expected on or off, got \"" + Token + "\"");
}

static void NeedArguments(const std::vector< std::string > &Tokens, int Count, int LineNumber)
{
    if (Tokens.size() < Count + 1)
    {
        throw ConfigurationError(AtLine(LineNumber) + Tokens[0] + " needs " + std::to_string(Count) + " argument(s)");
    }
}

/*****                                    FORMAT OF THE INPUT FILE                                 *****/
/* One keyword per line, followed by its arguments. Everything after '#' is a comment. The system is
   either read from an FCIDUMP file together with a geometry, or generated as a Hubbard model.
            integrals h4.fcidump                  # FCIDUMP file, 1-based indices
            overlap h4.overlap                    # optional, "i j S_ij" lines, identity otherwise
            geometry                              # one atom per line, Angstrom, closed by "end"
                H 0.0 0.0 0.0
                H 0.0 0.0 1.0
            end
            orbitals 1 1                          # orbitals on each atom, in order
            model hubbard chain 8 4.0 1.0         # or: ring N U t, grid Nx Ny U t
            electrons 8
            strategy autogen                      # autogen, chain or user
            order 2
            fragment 0 1 2 | 1                    # user fragments: atoms | centers
            solver fci                            # fci or hf
            matching full                         # full, chempot or none
            energy noncumulant                    # noncumulant or cumulant
            jacobian finite                       # finite or broyden
   Other keywords: lattice (nine numbers, rows are vectors), periodic (three flags), cutoff A B r,
   bond_tolerance, long_bond, hydrogens, ring_neighbors, trust_region, trust_radius, prefit_mu,
   max_iter, tolerance, max_scf, scf_tolerance, bath_threshold, match_full_p, scratch, restart,
   save_potential, fcidump prefix [embedding | fragment_mo].                                            */
void InputObj::Parse(std::istream &InputFile)
{
    std::string Line;
    int LineNumber = 0;
    bool InGeometry = false;
    while (std::getline(InputFile, Line))
    {
        LineNumber++;
        size_t Comment = Line.find('#');
        if (Comment != std::string::npos) Line = Line.substr(0, Comment);
        std::stringstream LineStream(Line);
        std::vector< std::string > Tokens;
        std::string Token;
        while (LineStream >> Token) Tokens.push_back(Token);
        if (Tokens.empty()) continue;

        std::string Key = Tokens[0];
        std::transform(Key.begin(), Key.end(), Key.begin(), ::tolower);

        if (InGeometry)
        {
            if (Key == "end")
            {
                InGeometry = false;
                continue;
            }
            if (Tokens.size() != 4)
            {
                throw ConfigurationError(AtLine(LineNumber) + "geometry lines are \"Symbol x y z\"");
            }
            Symbols.push_back(Tokens[0]);
            Positions.push_back(Eigen::RowVector3d(ToDouble(Tokens[1], LineNumber), ToDouble(Tokens[2], LineNumber), ToDouble(Tokens[3], LineNumber)));
            continue;
        }

        if (Key == "integrals")
        {
            NeedArguments(Tokens, 1, LineNumber);
            IntegralsInput = Tokens[1];
        }
        else if (Key == "overlap")
        {
            NeedArguments(Tokens, 1, LineNumber);
            OverlapInput = Tokens[1];
        }
        else if (Key == "geometry")
        {
            InGeometry = true;
            Symbols.clear();
            Positions.clear();
        }
        else if (Key == "orbitals")
        {
            NeedArguments(Tokens, 1, LineNumber);
            OrbitalsPerAtom.clear();
            for (int i = 1; i < Tokens.size(); i++) OrbitalsPerAtom.push_back(ToInt(Tokens[i], LineNumber));
        }
        else if (Key == "model")
        {
            NeedArguments(Tokens, 2, LineNumber);
            Model = Tokens[1];
            ModelLattice = Tokens[2];
            if (Model != "hubbard")
            {
                throw ConfigurationError(AtLine(LineNumber) + "model " + Model + " not implemented!");
            }
            if (ModelLattice == "chain" || ModelLattice == "ring")
            {
                NeedArguments(Tokens, 5, LineNumber);
                Nx = ToInt(Tokens[3], LineNumber);
                Ny = 1;
                HubbardU = ToDouble(Tokens[4], LineNumber);
                HubbardT = ToDouble(Tokens[5], LineNumber);
            }
            else if (ModelLattice == "grid")
            {
                NeedArguments(Tokens, 6, LineNumber);
                Nx = ToInt(Tokens[3], LineNumber);
                Ny = ToInt(Tokens[4], LineNumber);
                HubbardU = ToDouble(Tokens[5], LineNumber);
                HubbardT = ToDouble(Tokens[6], LineNumber);
            }
            else
            {
                throw ConfigurationError(AtLine(LineNumber) + "lattice " + ModelLattice + " not implemented!");
            }
        }
        else if (Key == "ring_neighbors")
        {
            NeedArguments(Tokens, 1, LineNumber);
            RingNeighbors = ToInt(Tokens[1], LineNumber);
        }
        else if (Key == "electrons")
        {
            NeedArguments(Tokens, 1, LineNumber);
            NumElectrons = ToInt(Tokens[1], LineNumber);
        }
        else if (Key == "lattice")
        {
            NeedArguments(Tokens, 9, LineNumber);
            for (int i = 0; i < 9; i++) LatticeVectors(i / 3, i % 3) = ToDouble(Tokens[i + 1], LineNumber);
        }
        else if (Key == "periodic")
        {
            NeedArguments(Tokens, 3, LineNumber);
            for (int i = 0; i < 3; i++) Periodic[i] = ToBool(Tokens[i + 1], LineNumber);
        }
        else if (Key == "cutoff")
        {
            NeedArguments(Tokens, 3, LineNumber);
            Cutoffs[std::make_pair(Tokens[1], Tokens[2])] = ToDouble(Tokens[3], LineNumber);
        }
        else if (Key == "bond_tolerance")
        {
            NeedArguments(Tokens, 1, LineNumber);
            BondTolerance = ToDouble(Tokens[1], LineNumber);
        }
        else if (Key == "long_bond")
        {
            LongBond = (Tokens.size() < 2) ? true : ToBool(Tokens[1], LineNumber);
        }
        else if (Key == "hydrogens")
        {
            TreatHydrogens = (Tokens.size() < 2) ? true : ToBool(Tokens[1], LineNumber);
        }
        else if (Key == "strategy")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Strategy = ParsePartitionStrategy(Tokens[1]);
        }
        else if (Key == "order")
        {
            NeedArguments(Tokens, 1, LineNumber);
            BEOrder = ToInt(Tokens[1], LineNumber);
        }
        else if (Key == "fragment")
        {
            NeedArguments(Tokens, 3, LineNumber);
            std::vector< int > Atoms, Centers;
            bool AfterBar = false;
            for (int i = 1; i < Tokens.size(); i++)
            {
                if (Tokens[i] == "|")
                {
                    AfterBar = true;
                    continue;
                }
                if (AfterBar) Centers.push_back(ToInt(Tokens[i], LineNumber));
                else Atoms.push_back(ToInt(Tokens[i], LineNumber));
            }
            if (!AfterBar || Centers.empty())
            {
                throw ConfigurationError(AtLine(LineNumber) + "fragment lines are \"atoms | centers\"");
            }
            UserFragments.push_back(Atoms);
            UserCenters.push_back(Centers);
        }
        else if (Key == "solver")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Solver = Tokens[1];
            if (Solver != "fci" && Solver != "hf")
            {
                throw ConfigurationError(AtLine(LineNumber) + "solver " + Solver + " not implemented!");
            }
        }
        else if (Key == "matching")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Matching = ParseMatchingMode(Tokens[1]);
        }
        else if (Key == "energy")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Expression = ParseEnergyExpression(Tokens[1]);
        }
        else if (Key == "jacobian")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Jacobian = ParseJacobianMethod(Tokens[1]);
        }
        else if (Key == "trust_region")
        {
            NeedArguments(Tokens, 1, LineNumber);
            UseTrustRegion = ToBool(Tokens[1], LineNumber);
        }
        else if (Key == "trust_radius")
        {
            NeedArguments(Tokens, 1, LineNumber);
            TrustRadius = ToDouble(Tokens[1], LineNumber);
        }
        else if (Key == "prefit_mu")
        {
            NeedArguments(Tokens, 1, LineNumber);
            PrefitMu = ToBool(Tokens[1], LineNumber);
        }
        else if (Key == "max_iter")
        {
            NeedArguments(Tokens, 1, LineNumber);
            MaxIterations = ToInt(Tokens[1], LineNumber);
        }
        else if (Key == "tolerance")
        {
            NeedArguments(Tokens, 1, LineNumber);
            Tolerance = ToDouble(Tokens[1], LineNumber);
        }
        else if (Key == "max_scf")
        {
            NeedArguments(Tokens, 1, LineNumber);
            MaxSCF = ToInt(Tokens[1], LineNumber);
        }
        else if (Key == "scf_tolerance")
        {
            NeedArguments(Tokens, 1, LineNumber);
            SCFTol = ToDouble(Tokens[1], LineNumber);
        }
        else if (Key == "bath_threshold")
        {
            NeedArguments(Tokens, 1, LineNumber);
            BathThreshold = ToDouble(Tokens[1], LineNumber);
        }
        else if (Key == "match_full_p")
        {
            MatchFullP = (Tokens.size() < 2) ? true : ToBool(Tokens[1], LineNumber);
        }
        else if (Key == "scratch")
        {
            NeedArguments(Tokens, 1, LineNumber);
            ScratchDirectory = Tokens[1];
        }
        else if (Key == "restart")
        {
            NeedArguments(Tokens, 1, LineNumber);
            RestartFile = Tokens[1];
        }
        else if (Key == "save_potential")
        {
            NeedArguments(Tokens, 1, LineNumber);
            SavePotentialFile = Tokens[1];
        }
        else if (Key == "fcidump")
        {
            NeedArguments(Tokens, 1, LineNumber);
            FCIDUMPPrefix = Tokens[1];
            if (Tokens.size() > 2)
            {
                if (Tokens[2] == "fragment_mo") FCIDUMPMOBasis = true;
                else if (Tokens[2] == "embedding") FCIDUMPMOBasis = false;
                else throw ConfigurationError(AtLine(LineNumber) + "FCIDUMP basis " + Tokens[2] + " not implemented!");
            }
        }
        else if (Key == "output")
        {
            NeedArguments(Tokens, 1, LineNumber);
            if (OutputName.empty()) OutputName = Tokens[1];
        }
        else
        {
            throw ConfigurationError(AtLine(LineNumber) + "unknown keyword " + Tokens[0]);
        }
    }
    if (InGeometry)
    {
        throw ConfigurationError("Geometry block is not closed by \"end\"");
    }
}

void InputObj::Set()
{
    std::ifstream InputFile(InputName.c_str());
    if (!InputFile.is_open())
    {
        throw ConfigurationError("Cannot open input file " + InputName);
    }
    Parse(InputFile);
    BuildSystem();
}

/* Builds the integrals, the bond graph and the orbital to atom map from the parsed keywords. A
   Hubbard model has one site per lattice point and an identity overlap. Otherwise the integrals come
   from the FCIDUMP file and the bonding from the geometry. */
void InputObj::BuildSystem()
{
    if (Model == "hubbard")
    {
        if (ModelLattice == "chain") Graph.InitChain(Nx);
        else if (ModelLattice == "ring") Graph.InitRing(Nx, RingNeighbors);
        else Graph.InitGrid(Nx, Ny);
        HubbardIntegrals(Graph.AdjacencyMatrix, HubbardT, HubbardU, HCore, ERI);
        NumAO = Graph.NumAtoms;
        OverlapMatrix = Eigen::MatrixXd::Identity(NumAO, NumAO);
        ENuc = 0;
        if (NumElectrons < 0) NumElectrons = NumAO;
        OrbitalAtom.clear();
        return;
    }

    if (IntegralsInput.empty())
    {
        throw ConfigurationError("Input needs either integrals or a model");
    }
    int FileElectrons;
    ReadFCIDUMP(IntegralsInput, HCore, ERI, ENuc, NumAO, FileElectrons);
    if (NumElectrons < 0) NumElectrons = FileElectrons;
    OverlapMatrix = Eigen::MatrixXd::Identity(NumAO, NumAO);
    if (!OverlapInput.empty()) ReadOverlap(OverlapInput, OverlapMatrix);

    if (Symbols.empty())
    {
        throw ConfigurationError("Input needs a geometry block to find the bonds");
    }
    Eigen::MatrixXd Coordinates(Symbols.size(), 3);
    for (int i = 0; i < Symbols.size(); i++) Coordinates.row(i) = Positions[i];
    Graph.Tolerance = BondTolerance;
    Graph.LongBond = LongBond;
    Graph.Cutoffs = Cutoffs;
    Graph.Lattice = LatticeVectors;
    for (int i = 0; i < 3; i++) Graph.Periodic[i] = Periodic[i];
    Graph.Build(Symbols, Coordinates);

    OrbitalAtom.clear();
    if (OrbitalsPerAtom.empty())
    {
        if (NumAO != Symbols.size())
        {
            throw ConfigurationError("There are " + std::to_string(NumAO) + " orbitals on " + std::to_string(Symbols.size()) + " atoms, the orbitals keyword is needed");
        }
        return;
    }
    if (OrbitalsPerAtom.size() != Symbols.size())
    {
        throw ConfigurationError("The orbitals keyword needs one count per atom");
    }
    for (int a = 0; a < OrbitalsPerAtom.size(); a++)
    {
        for (int i = 0; i < OrbitalsPerAtom[a]; i++) OrbitalAtom.push_back(a);
    }
    if (OrbitalAtom.size() != NumAO)
    {
        throw ConfigurationError("Orbital counts add up to " + std::to_string(OrbitalAtom.size()) + " but the integrals have " + std::to_string(NumAO) + " orbitals");
    }
}

Fragmenting InputObj::MakeFragmenting() const
{
    Fragmenting Frag;
    Frag.Strategy = Strategy;
    Frag.BEOrder = BEOrder;
    Frag.TreatHydrogens = TreatHydrogens;
    Frag.OrbitalAtom = OrbitalAtom;
    Frag.UserFragments = UserFragments;
    Frag.UserCenters = UserCenters;
    return Frag;
}

void InputObj::ConfigureBootstrap(Bootstrap &BE) const
{
    BE.Matching = Matching;
    BE.Jacobian = Jacobian;
    BE.Expression = Expression;
    BE.MatchFullP = MatchFullP;
    BE.UseTrustRegion = UseTrustRegion;
    BE.TrustRadius = TrustRadius;
    BE.PrefitMu = PrefitMu;
    BE.MaxIterations = MaxIterations;
    BE.Tolerance = Tolerance;
    BE.BathThreshold = BathThreshold;
    BE.ScratchDirectory = ScratchDirectory;
}
