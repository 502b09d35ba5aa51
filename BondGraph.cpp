#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <cmath>
#include <string>
#include <map>
#include <queue>
#include <algorithm>
#include "BondGraph.h"
#include "BEErrors.h"

// Single bond covalent radii in Angstrom (Cordero et al., Dalton Trans. 2008).
double CovalentRadius(const std::string &Symbol)
{
    static const std::map< std::string, double > Radii = {
        { "H", 0.31 }, { "He", 0.28 },
        { "Li", 1.28 }, { "Be", 0.96 }, { "B", 0.84 }, { "C", 0.76 }, { "N", 0.71 }, { "O", 0.66 }, { "F", 0.57 }, { "Ne", 0.58 },
        { "Na", 1.66 }, { "Mg", 1.41 }, { "Al", 1.21 }, { "Si", 1.11 }, { "P", 1.07 }, { "S", 1.05 }, { "Cl", 1.02 }, { "Ar", 1.06 },
        { "K", 2.03 }, { "Ca", 1.76 }, { "Sc", 1.70 }, { "Ti", 1.60 }, { "V", 1.53 }, { "Cr", 1.39 }, { "Mn", 1.39 }, { "Fe", 1.32 },
        { "Co", 1.26 }, { "Ni", 1.24 }, { "Cu", 1.32 }, { "Zn", 1.22 }, { "Ga", 1.22 }, { "Ge", 1.20 }, { "As", 1.19 }, { "Se", 1.20 },
        { "Br", 1.20 }, { "Kr", 1.16 }, { "I", 1.39 }
    };
    std::map< std::string, double >::const_iterator it = Radii.find(Symbol);
    if (it == Radii.end())
    {
        throw ConfigurationError("No covalent radius for element " + Symbol);
    }
    return it->second;
}

void BondGraph::Build(const std::vector< std::string > &Syms, const Eigen::MatrixXd &Coords)
{
    if (Coords.rows() != (int)Syms.size() || Coords.cols() != 3)
    {
        throw ConfigurationError("Geometry needs one row of three coordinates per atom");
    }
    Symbols = Syms;
    Coordinates = Coords;
    NumAtoms = Syms.size();

    AdjacencyMatrix = Eigen::MatrixXi::Zero(NumAtoms, NumAtoms);
    for (int i = 0; i < NumAtoms; i++)
    {
        for (int j = i + 1; j < NumAtoms; j++)
        {
            if (Distance(i, j) <= Cutoff(i, j))
            {
                AdjacencyMatrix(i, j) = 1;
                AdjacencyMatrix(j, i) = 1;
            }
        }
    }
}

double BondGraph::Distance(int i, int j) const
{
    Eigen::RowVector3d dR = Coordinates.row(j) - Coordinates.row(i);
    if (!Periodic[0] && !Periodic[1] && !Periodic[2]) return dR.norm();

    // Minimum image over the neighboring cells of each periodic axis.
    double MinDist = dR.norm();
    for (int a = -1; a <= 1; a++)
    {
        if (a != 0 && !Periodic[0]) continue;
        for (int b = -1; b <= 1; b++)
        {
            if (b != 0 && !Periodic[1]) continue;
            for (int c = -1; c <= 1; c++)
            {
                if (c != 0 && !Periodic[2]) continue;
                Eigen::RowVector3d Shift = a * Lattice.row(0) + b * Lattice.row(1) + c * Lattice.row(2);
                MinDist = std::min(MinDist, (dR + Shift).norm());
            }
        }
    }
    return MinDist;
}

double BondGraph::Cutoff(int i, int j) const
{
    double RadiusSum;
    std::map< std::pair< std::string, std::string >, double >::const_iterator it = Cutoffs.find(std::make_pair(Symbols[i], Symbols[j]));
    if (it == Cutoffs.end()) it = Cutoffs.find(std::make_pair(Symbols[j], Symbols[i]));
    if (it != Cutoffs.end()) RadiusSum = it->second;
    else RadiusSum = CovalentRadius(Symbols[i]) + CovalentRadius(Symbols[j]);

    double Cut = RadiusSum + Tolerance;
    if (LongBond) Cut += LongBondExtra;
    return Cut;
}

// Nearest neighbor chain, 0 - 1 - ... - (N - 1).
void BondGraph::InitChain(int N)
{
    NumAtoms = N;
    Symbols.clear();
    AdjacencyMatrix = Eigen::MatrixXi::Zero(N, N);
    for (int i = 0; i < N - 1; i++)
    {
        AdjacencyMatrix(i, i + 1) = 1;
        AdjacencyMatrix(i + 1, i) = 1;
    }
}

void BondGraph::InitRing(int N, int Neighbors)
{
    NumAtoms = N;
    Symbols.clear();
    AdjacencyMatrix = Eigen::MatrixXi::Zero(N, N);
    for (int i = 0; i < N; i++)
    {
        for (int j = 0; j < Neighbors; j++)
        {
            if ((i + (j + 1)) % N == i) continue;
            AdjacencyMatrix(i, (i + (j + 1)) % N) = 1;
            AdjacencyMatrix(i, (i + N - (j + 1)) % N) = 1;
        }
    }
}

void BondGraph::InitGrid(int Nx, int Ny)
{
    int N = Nx * Ny;
    NumAtoms = N;
    Symbols.clear();
    AdjacencyMatrix = Eigen::MatrixXi::Zero(N, N);
    for (int i = 0; i < N; i++)
    {
        // Coordinate of i'th atom on the grid.
        int xPos = i % Nx;
        int yPos = i / Nx;

        if (xPos != 0) AdjacencyMatrix(i, i - 1) = 1;
        if (xPos != Nx - 1) AdjacencyMatrix(i, i + 1) = 1;
        if (yPos != 0) AdjacencyMatrix(i, i - Nx) = 1;
        if (yPos != Ny - 1) AdjacencyMatrix(i, i + Nx) = 1;
    }
}

std::vector< int > BondGraph::Neighbors(int Atom) const
{
    std::vector< int > Adjacent;
    for (int i = 0; i < NumAtoms; i++)
    {
        if (i == Atom) continue;
        if (AdjacencyMatrix(Atom, i) == 1) Adjacent.push_back(i);
    }
    return Adjacent;
}

std::vector< std::vector< int > > BondGraph::Components() const
{
    std::vector< std::vector< int > > AllComponents;
    std::vector< bool > Visited(NumAtoms, false);
    for (int Start = 0; Start < NumAtoms; Start++)
    {
        if (Visited[Start]) continue;
        std::vector< int > Component;
        std::queue< int > Queue;
        Queue.push(Start);
        Visited[Start] = true;
        while (!Queue.empty())
        {
            int Atom = Queue.front();
            Queue.pop();
            Component.push_back(Atom);
            std::vector< int > Adjacent = Neighbors(Atom);
            for (int i = 0; i < Adjacent.size(); i++)
            {
                if (Visited[Adjacent[i]]) continue;
                Visited[Adjacent[i]] = true;
                Queue.push(Adjacent[i]);
            }
        }
        std::sort(Component.begin(), Component.end());
        AllComponents.push_back(Component);
    }
    return AllComponents;
}

bool BondGraph::isHydrogen(int Atom) const
{
    if (Symbols.empty()) return false;
    return Symbols[Atom] == "H";
}

void BondGraph::PrintGraph(std::ostream &Out) const
{
    for (int i = 0; i < NumAtoms; i++)
    {
        Out << "BE-DMET: Atom " << i;
        if (!Symbols.empty()) Out << " (" << Symbols[i] << ")";
        Out << " bonded to";
        std::vector< int > Adjacent = Neighbors(i);
        for (int j = 0; j < Adjacent.size(); j++) Out << " " << Adjacent[j];
        Out << std::endl;
    }
}
