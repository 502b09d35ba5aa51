#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>
#include <string>
#include <map>
#include <utility>
#include "BondGraph.h"
#include "Fragmenting.h"
#include "Bootstrap.h"
#include "BEEnergy.h"

class InputObj
{
    public:
        void SetNames(std::string, std::string);
        void Set();
        void Parse(std::istream&);
        void BuildSystem();

        std::string InputName;
        std::string OutputName;
        std::string IntegralsInput;
        std::string OverlapInput;

        /* The system */
        int NumAO = 0;
        int NumElectrons = -1; // Taken from the integral file or half filling when not given.
        double ENuc = 0;
        Eigen::MatrixXd OverlapMatrix;
        Eigen::MatrixXd HCore;
        Eigen::Tensor<double, 4> ERI;

        /* Lattice models */
        std::string Model;
        std::string ModelLattice;
        int Nx = 0;
        int Ny = 1;
        int RingNeighbors = 1;
        double HubbardU = 0;
        double HubbardT = 1;

        /* Geometry and bonding */
        std::vector< std::string > Symbols;
        std::vector< Eigen::RowVector3d > Positions;
        std::vector< int > OrbitalsPerAtom;
        Eigen::Matrix3d LatticeVectors = Eigen::Matrix3d::Zero();
        bool Periodic[3] = { false, false, false };
        double BondTolerance = 0.45;
        bool LongBond = false;
        std::map< std::pair< std::string, std::string >, double > Cutoffs;
        BondGraph Graph;
        std::vector< int > OrbitalAtom;

        /* Fragmentation */
        PartitionStrategy Strategy = PartitionStrategy::Autogen;
        int BEOrder = 1;
        bool TreatHydrogens = false;
        std::vector< std::vector< int > > UserFragments;
        std::vector< std::vector< int > > UserCenters;

        /* Reference, solver and matching */
        int MaxSCF = 5000;
        double SCFTol = 1E-8;
        std::string Solver = "fci";
        MatchingMode Matching = MatchingMode::Full;
        JacobianMethod Jacobian = JacobianMethod::FiniteDifference;
        EnergyExpression Expression = EnergyExpression::NonCumulant;
        bool UseTrustRegion = true;
        double TrustRadius = 0.5;
        bool PrefitMu = true;
        int MaxIterations = 50;
        double Tolerance = 1E-6;
        double BathThreshold = 1E-8;
        bool MatchFullP = false;

        /* Files */
        std::string ScratchDirectory;
        std::string RestartFile;
        std::string SavePotentialFile;
        std::string FCIDUMPPrefix;
        bool FCIDUMPMOBasis = false;

        Fragmenting MakeFragmenting() const;
        void ConfigureBootstrap(Bootstrap&) const;
};
