#include <fstream>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "TestSystems.h"
#include "Functions.h"

std::ofstream& NullOutput()
{
    static std::ofstream Out("/dev/null");
    return Out;
}

MeanField HubbardChainMeanField(int N, double U, double t, int NumElectrons)
{
    BondGraph Graph;
    Graph.InitChain(N);
    Eigen::MatrixXd H;
    Eigen::Tensor<double, 4> ERI;
    HubbardIntegrals(Graph.AdjacencyMatrix, t, U, H, ERI);

    MeanField MF;
    MF.SetIntegrals(Eigen::MatrixXd::Identity(N, N), H, ERI, 0.0, (NumElectrons < 0) ? N : NumElectrons);
    MF.RunRHF(NullOutput(), 5000, 1E-10);
    return MF;
}

Fragmenting HubbardChainFragments(int N, PartitionStrategy Strategy, int Order)
{
    BondGraph Graph;
    Graph.InitChain(N);
    Fragmenting Frag;
    Frag.Strategy = Strategy;
    Frag.BEOrder = Order;
    Frag.Generate(Graph);
    return Frag;
}

Fragment WholeSystemFragment(int N)
{
    Fragment Frag;
    Frag.Id = 0;
    for (int i = 0; i < N; i++)
    {
        Frag.Atoms.push_back(i);
        Frag.CenterAtoms.push_back(i);
        Frag.Sites.push_back(i);
        Frag.CenterSites.push_back(i);
        Frag.Weights.push_back(1.0);
    }
    return Frag;
}

EmbeddedHamiltonian WholeSystemHamiltonian(const MeanField &MF)
{
    Fragment Frag = WholeSystemFragment(MF.NumAO);
    EmbeddingBasis Basis = SchmidtDecomposition(Frag, MF.DensityMatrix, MF.OverlapMatrix);
    return EmbedHamiltonian(Frag, Basis, MF.HCore, MF.FockMatrix, MF.DensityMatrix, MF.ERI, MF.ENuc);
}
