#pragma once
#include <string>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Embedding.h"

// Spin summed densities: OneRDM_pq = <E_pq>, TwoRDM_pqrs = <E_pq E_rs> - delta_qr <E_ps>,
// so that E = sum h_pq OneRDM_pq + 1/2 sum (pq|rs) TwoRDM_pqrs.
struct SolverResult
{
	double Energy = 0; // Includes ECore.
	double CorrelationEnergy = 0; // Energy minus the energy of the reference density.
	Eigen::MatrixXd OneRDM;
	Eigen::Tensor<double, 4> TwoRDM;
	bool Converged = false;
	int Iterations = 0;
};

// Correlated solver for one embedded problem. Solve is called for several fragments at once
// and must not change the solver.
class ImpuritySolver
{
public:
	virtual ~ImpuritySolver() {}
	virtual SolverResult Solve(const EmbeddedHamiltonian&) const = 0;
	virtual std::string Name() const = 0;
};

// Hartree-Fock inside the embedding space, started from the projected reference density.
class EmbeddedHF : public ImpuritySolver
{
public:
	int MaxSCF = 500;
	double SCFTol = 1E-10;

	SolverResult Solve(const EmbeddedHamiltonian&) const;
	std::string Name() const { return "HF"; }
};

double EmbeddedEnergy(const EmbeddedHamiltonian&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&);
