#pragma once
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

// Fragment plus bath orbitals of one fragment, as columns in the orthogonalized site basis.
// The first NumFragmentOrbitals columns are unit vectors on the fragment sites.
class EmbeddingBasis
{
public:
	int FragmentId = -1;
	int NumFragmentOrbitals = 0;
	int NumBath = 0;
	int NumElectrons = 0;
	Eigen::MatrixXd TA;
	Eigen::MatrixXd CoreDensity; // Spin summed, full site basis.
	Eigen::VectorXd SingularValues;

	int NumOrbitals() const { return TA.cols(); }
};

// Hamiltonian of one fragment in its embedding basis. The one electron operator seen by the
// solver is HCore + CorePotential + PotentialTerm.
class EmbeddedHamiltonian
{
public:
	int FragmentId = -1;
	int NumOrbitals = 0;
	int NumElectrons = 0;
	Eigen::MatrixXd HCore;
	Eigen::MatrixXd CorePotential;
	Eigen::MatrixXd PotentialTerm;
	Eigen::MatrixXd Fock;
	Eigen::MatrixXd ReferenceDensity; // Mean field density projected into the embedding space.
	Eigen::Tensor<double, 4> TwoBody; // (pq|rs), chemists' notation.
	double ECore = 0; // Frozen core energy plus nuclear repulsion.

	Eigen::MatrixXd OneBody() const { return HCore + CorePotential + PotentialTerm; }
};
