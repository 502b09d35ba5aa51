#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>
#include <string>
#include <fstream>
#include <functional>
#include "Functions.h"
#include "Fragmenting.h"
#include "Embedding.h"
#include "CorrelationPotential.h"
#include "MeanField.h"
#include "Solver.h"
#include "BEEnergy.h"

enum class MatchingMode { None, ChemicalPotential, Full };
enum class JacobianMethod { FiniteDifference, Broyden };
enum class MatchStatus { Converged, Stalled, Cancelled, OneShot };

MatchingMode ParseMatchingMode(const std::string&);
JacobianMethod ParseJacobianMethod(const std::string&);
std::string StatusName(MatchStatus);

// Solution of one fragment under one version of the potential.
struct FragmentResult
{
	double Energy = 0;
	double EmbeddedHFEnergy = 0; // Energy of the projected reference density.
	double CorrelationEnergy = 0;
	Eigen::MatrixXd OneRDM;
	Eigen::Tensor<double, 4> TwoRDM;
	int PotentialVersion = 0;
	bool Converged = false;
	int Iterations = 0;
};

struct BEResult
{
	double Energy = 0;
	double CorrelationEnergy = 0;
	BEEnergy Components;
	MatchStatus Status = MatchStatus::Stalled;
	int Iterations = 0;
	double ResidualNorm = 0;
	CorrelationPotential Potential;
	std::vector< FragmentResult > Fragments;
};

class Bootstrap
{
public:
	MatchingMode Matching = MatchingMode::Full;
	JacobianMethod Jacobian = JacobianMethod::FiniteDifference;
	EnergyExpression Expression = EnergyExpression::NonCumulant;
	bool MatchFullP = false; // Match every element of the edge blocks instead of the diagonal only.
	bool UseTrustRegion = true;
	bool PrefitMu = true;
	double TrustRadius = 0.5;
	double MaxTrustRadius = 2.0;
	int MaxIterations = 50;
	double Tolerance = 1E-6;
	double BathThreshold = 1E-8;
	std::string ScratchDirectory;
	// Asked at every Solve and Compare boundary with the current iteration; true stops the run.
	std::function< bool(int) > Cancel;

	std::ofstream* Output = nullptr;
	int NumAO;
	int NumElectrons;
	int NumFrag;
	double EHF;
	double ENuc;

	// Mean field quantities in the orthogonalized site basis.
	Eigen::MatrixXd HLO;
	Eigen::MatrixXd FockLO;
	Eigen::MatrixXd DensityLO;
	Eigen::Tensor<double, 4> ERILO;

	std::vector< Fragment > Frags;
	std::vector< EmbeddingBasis > Bases;
	std::vector< EmbeddedHamiltonian > BareHamiltonians;
	std::vector< double > ReferenceEnergies;

	std::vector< CorrelationPotential > PotentialHistory;
	std::vector< FragmentResult > Results;
	std::vector< double > ResidualHistory;
	MatchStatus Status = MatchStatus::Stalled;
	int Iteration = 0;

	void Init(const MeanField&, const std::vector< Fragment >&, std::ofstream&);
	void InitFromFragmenting(const MeanField&, const Fragmenting&, std::ofstream&);
	void SetPotential(const CorrelationPotential&);
	const CorrelationPotential& CurrentPotential() const { return PotentialHistory.back(); }
	BEResult doBootstrap(const ImpuritySolver&);

	Eigen::VectorXd CalcResidual(const std::vector< FragmentResult >&) const;
	double NumberResidual(const std::vector< FragmentResult >&) const;
	void ExportFCIDUMP(const std::string&, bool) const;

private:
	double dLambda = 1E-4;
	double dMu = 1E-4;
	double MuBound = 10.0;

	void SolveFragments(const ImpuritySolver&, const CorrelationPotential&, const std::vector< int >&, std::vector< FragmentResult >&) const;
	std::vector< int > AllFragments() const;
	std::vector< int > FragmentsWithEdge(int) const;
	Eigen::VectorXd MatchResidual(const std::vector< FragmentResult >&) const;
	double ResidualNorm(const Eigen::VectorXd&) const;
	Eigen::MatrixXd CalcJacobian(const ImpuritySolver&, const Eigen::VectorXd&, const Eigen::VectorXd&);
	void OptMu(const ImpuritySolver&);
	BEResult CollectResult() const;
	void Log(const std::string&) const;
};
