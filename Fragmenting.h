#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <string>
#include "BondGraph.h"

enum class PartitionStrategy { Autogen, Chain, User };
PartitionStrategy ParsePartitionStrategy(const std::string&);
std::string StrategyName(PartitionStrategy);

// Sites of one edge atom of a fragment, and the fragment that owns that atom as a center.
struct EdgeGroup
{
    int Atom;
    int Owner;
    std::vector< int > Sites;
};

class Fragment
{
    public:
        int Id;
        std::vector< int > Atoms;
        std::vector< int > CenterAtoms;
        std::vector< int > EdgeAtoms;

        // Global site (orthogonalized orbital) indices, sorted. The embedding basis puts
        // fragment orbitals first in this order, so a site's local index is its position here.
        std::vector< int > Sites;
        std::vector< int > CenterSites;
        std::vector< int > EdgeSites;
        std::vector< double > Weights; // Parallel to Sites.
        std::vector< EdgeGroup > Edges;

        int LocalIndex(int) const;
        std::vector< int > CenterIndex() const;
        bool isCenterAtom(int) const;
};

class Fragmenting
{
    public:
        PartitionStrategy Strategy = PartitionStrategy::Autogen;
        int BEOrder = 1;
        bool TreatHydrogens = false;

        // Atom of every site. Left empty, each atom carries a single site of the same index.
        std::vector< int > OrbitalAtom;

        std::vector< std::vector< int > > UserFragments;
        std::vector< std::vector< int > > UserCenters;

        Eigen::MatrixXi AdjacencyMatrix;
        // First index is the fragment, second index is the atom in the fragment.
        std::vector< std::vector< int > > Fragments;
        std::vector< std::vector< int > > CenterPosition;

        std::vector< Fragment > Frags;

        void Generate(const BondGraph&);
        void PrintFrag(std::ostream&) const;

    private:
        void AutogenIteration(const BondGraph&);
        void ChainIteration(const BondGraph&);
        void UserIteration(const BondGraph&);
        void SortByCenter();
        void BuildFragments(int);
};
