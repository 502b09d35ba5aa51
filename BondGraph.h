#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <string>
#include <map>
#include <utility>

double CovalentRadius(const std::string&);

class BondGraph
{
    public:
        int NumAtoms = 0;
        Eigen::MatrixXi AdjacencyMatrix;
        std::vector< std::string > Symbols;
        Eigen::MatrixXd Coordinates; // NumAtoms x 3, in Angstrom.

        // Two atoms are bonded when their distance is at most r_A + r_B + Tolerance,
        // plus LongBondExtra when LongBond is set. Cutoffs overrides r_A + r_B for a pair of elements.
        double Tolerance = 0.45;
        bool LongBond = false;
        double LongBondExtra = 0.8;
        std::map< std::pair< std::string, std::string >, double > Cutoffs;

        // Rows are lattice vectors. Distances along a periodic axis use the minimum image.
        Eigen::Matrix3d Lattice = Eigen::Matrix3d::Zero();
        bool Periodic[3] = { false, false, false };

        void Build(const std::vector< std::string >&, const Eigen::MatrixXd&);
        void InitChain(int);
        void InitRing(int, int);
        void InitGrid(int, int);

        double Distance(int, int) const;
        double Cutoff(int, int) const;
        std::vector< int > Neighbors(int) const;
        std::vector< std::vector< int > > Components() const;
        bool isHydrogen(int) const;

        void PrintGraph(std::ostream&) const;
};
