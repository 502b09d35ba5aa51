#pragma once
#include <fstream>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "MeanField.h"
#include "Fragmenting.h"
#include "Embedding.h"
#include "BondGraph.h"

// Output stream for code that insists on logging to a file.
std::ofstream& NullOutput();

// Converged RHF reference of a Hubbard chain with unit overlap, half filled unless NumElectrons is given.
MeanField HubbardChainMeanField(int N, double U, double t = 1.0, int NumElectrons = -1);

Fragmenting HubbardChainFragments(int N, PartitionStrategy Strategy, int Order);

// One fragment holding every site as a center, so the embedding space is the whole system.
Fragment WholeSystemFragment(int N);
EmbeddedHamiltonian WholeSystemHamiltonian(const MeanField &MF);
