#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Solver.h"
#include "Functions.h"

// sum h_pq D_pq + 1/2 sum (pq|rs) G_pqrs + ECore, with h the full one electron operator of the problem.
double EmbeddedEnergy(const EmbeddedHamiltonian &Ham, const Eigen::MatrixXd &OneRDM, const Eigen::Tensor<double, 4> &TwoRDM)
{
	Eigen::Tensor<double, 0> TwoBodyEnergy = (Ham.TwoBody * TwoRDM).sum();
	return Ham.OneBody().cwiseProduct(OneRDM).sum() + 0.5 * TwoBodyEnergy() + Ham.ECore;
}

SolverResult EmbeddedHF::Solve(const EmbeddedHamiltonian &Ham) const
{
	SolverResult Result;
	int n = Ham.NumOrbitals;
	Eigen::MatrixXd D = Ham.ReferenceDensity;
	Eigen::MatrixXd F, C;
	Eigen::VectorXd EV;
	double Energy = 0;
	Result.Converged = SCF(Ham.OneBody(), Eigen::MatrixXd::Identity(n, n), Ham.TwoBody, Ham.NumElectrons / 2, D, F, C, EV, Energy, MaxSCF, SCFTol, Result.Iterations);
	Result.Energy = Energy + Ham.ECore;
	Result.CorrelationEnergy = 0;
	Result.OneRDM = D;
	Result.TwoRDM = MeanFieldTwoRDM(D);
	return Result;
}
