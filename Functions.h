#pragma once
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Embedding.h"
#include "Fragmenting.h"
#include "CorrelationPotential.h"
// Header files containg a list of all the free functions used in the BE code.

// DMET.cpp
void LowdinOrthogonalization(const Eigen::MatrixXd &OverlapMatrix, Eigen::MatrixXd &SHalf, Eigen::MatrixXd &SMinusHalf);
Eigen::Tensor<double, 4> TransformERI(const Eigen::Tensor<double, 4> &ERI, const Eigen::MatrixXd &C);
EmbeddingBasis SchmidtDecomposition(const Fragment &Frag, const Eigen::MatrixXd &DensityLO, double Threshold = 1E-8);
EmbeddingBasis SchmidtDecomposition(const Fragment &Frag, const Eigen::MatrixXd &DensityMatrix, const Eigen::MatrixXd &OverlapMatrix, double Threshold = 1E-8);
double ERIFingerprint(const Eigen::MatrixXd &TA, const Eigen::Tensor<double, 4> &ERILO);
EmbeddedHamiltonian EmbedHamiltonian(const Fragment &Frag, const EmbeddingBasis &Basis, const Eigen::MatrixXd &HLO, const Eigen::MatrixXd &FockLO, const Eigen::MatrixXd &DensityLO,
                                     const Eigen::Tensor<double, 4> &ERILO, double ENuc, const std::string &ScratchDirectory = "");
EmbeddedHamiltonian AddCorrelationPotential(const EmbeddedHamiltonian &Bare, const Fragment &Frag, const CorrelationPotential &Potential);

// Fock.cpp
double ExchangeTerm(int m, int n, const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI);
Eigen::MatrixXd CoulombExchange(const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI);
void BuildFockMatrix(Eigen::MatrixXd &FockMatrix, const Eigen::MatrixXd &HCore, const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI);
Eigen::Tensor<double, 4> MeanFieldTwoRDM(const Eigen::MatrixXd &D);

// SCF.cpp
double MatrixDot(const Eigen::MatrixXd &FirstMatrix, const Eigen::MatrixXd &SecondMatrix);
void DIIS(Eigen::MatrixXd &FockMatrix, std::vector< Eigen::MatrixXd > &AllFockMatrices, std::vector< Eigen::MatrixXd > &AllErrorMatrices);
void DiagonalizeFock(const Eigen::MatrixXd &FockMatrix, const Eigen::MatrixXd &SOrtho, Eigen::MatrixXd &CoeffMatrix, Eigen::VectorXd &OrbitalEV);
bool SCF(const Eigen::MatrixXd &HCore, const Eigen::MatrixXd &OverlapMatrix, const Eigen::Tensor<double, 4> &ERI, int NumOcc, Eigen::MatrixXd &DensityMatrix, Eigen::MatrixXd &FockMatrix,
         Eigen::MatrixXd &CoeffMatrix, Eigen::VectorXd &OrbitalEV, double &Energy, int MaxSCF, double SCFTol, int &SCFCount);

// IntegralIO.cpp
void ReadFCIDUMP(const std::string &FileName, Eigen::MatrixXd &HCore, Eigen::Tensor<double, 4> &ERI, double &ECore, int &NumOrbitals, int &NumElectrons);
void WriteFCIDUMP(const std::string &FileName, const Eigen::MatrixXd &HCore, const Eigen::Tensor<double, 4> &ERI, double ECore, int NumElectrons);
void ReadOverlap(const std::string &FileName, Eigen::MatrixXd &OverlapMatrix);
bool ReadERICache(const std::string &FileName, Eigen::Tensor<double, 4> &ERI, int NumOrbitals, double Fingerprint);
void WriteERICache(const std::string &FileName, const Eigen::Tensor<double, 4> &ERI, double Fingerprint);
void SavePotential(const std::string &FileName, const CorrelationPotential &Potential);
CorrelationPotential LoadPotential(const std::string &FileName, const CorrelationPotential &Template);

// Hubbard.cpp
void HubbardIntegrals(const Eigen::MatrixXi &AdjacencyMatrix, double t, double U, Eigen::MatrixXd &HCore, Eigen::Tensor<double, 4> &ERI);
