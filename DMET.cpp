#include <iostream>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <Eigen/SVD>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>
#include <cmath>
#include <string>
#include <algorithm>
#include "Functions.h"
#include "BEErrors.h"

// S^(1/2) and S^(-1/2). The orthogonalized (Lowdin) orbitals are the sites of the embedding.
void LowdinOrthogonalization(const Eigen::MatrixXd &OverlapMatrix, Eigen::MatrixXd &SHalf, Eigen::MatrixXd &SMinusHalf)
{
	Eigen::SelfAdjointEigenSolver< Eigen::MatrixXd > EigensystemS(OverlapMatrix);
	Eigen::VectorXd Lambda = EigensystemS.eigenvalues();
	if (Lambda.size() > 0 && Lambda.minCoeff() < 1E-10)
	{
		throw ConfigurationError("Overlap matrix is singular or not positive definite");
	}
	Eigen::MatrixXd V = EigensystemS.eigenvectors();
	SHalf = V * Lambda.cwiseSqrt().asDiagonal() * V.transpose();
	SMinusHalf = V * Lambda.cwiseSqrt().cwiseInverse().asDiagonal() * V.transpose();
}

// (ab|cd) = sum_pqrs C_pa C_qb C_rc C_sd (pq|rs), one index at a time. Each contraction moves the new
// index to the back, so after four of them the order is (a, b, c, d) again.
Eigen::Tensor<double, 4> TransformERI(const Eigen::Tensor<double, 4> &ERI, const Eigen::MatrixXd &C)
{
	Eigen::TensorMap< const Eigen::Tensor<double, 2> > CTensor(C.data(), C.rows(), C.cols());
	Eigen::array< Eigen::IndexPair<int>, 1 > FirstIndex = { Eigen::IndexPair<int>(0, 0) };
	Eigen::Tensor<double, 4> T1 = ERI.contract(CTensor, FirstIndex);
	Eigen::Tensor<double, 4> T2 = T1.contract(CTensor, FirstIndex);
	Eigen::Tensor<double, 4> T3 = T2.contract(CTensor, FirstIndex);
	Eigen::Tensor<double, 4> T4 = T3.contract(CTensor, FirstIndex);
	return T4;
}

struct BathCandidate
{
	double SingularValue;
	int LargestSite;
	Eigen::VectorXd Orbital;
};

/// <summary>
/// Schmidt decomposition of the mean field density for one fragment. The coupling block between
/// environment and fragment, gamma[env, frag] with gamma = D / 2, is decomposed by SVD. Its left singular
/// vectors with nonzero singular value are the bath orbitals. Together with the fragment sites they
/// span a space that holds an integer number of electrons and no density leaks out of it.
/// </summary>
/// <param name="Frag">
/// Fragment whose sites form the first columns of the basis.
/// </param>
/// <param name="DensityLO">
/// Spin summed density matrix in the orthogonalized site basis.
/// </param>
/// <param name="Threshold">
/// Singular values at or below this are numerically zero and their vectors are not bath orbitals.
/// </param>
EmbeddingBasis SchmidtDecomposition(const Fragment &Frag, const Eigen::MatrixXd &DensityLO, double Threshold)
{
	int N = DensityLO.rows();
	int NumFragOrb = Frag.Sites.size();
	std::vector< int > EnvironmentOrbitals;
	for (int s = 0; s < N; s++)
	{
		if (Frag.LocalIndex(s) < 0) EnvironmentOrbitals.push_back(s);
	}
	int NumEnv = EnvironmentOrbitals.size();

	Eigen::MatrixXd Gamma = 0.5 * DensityLO;
	std::vector< BathCandidate > Bath;
	if (NumEnv > 0 && NumFragOrb > 0)
	{
		Eigen::MatrixXd Coupling(NumEnv, NumFragOrb);
		for (int i = 0; i < NumEnv; i++)
		{
			for (int j = 0; j < NumFragOrb; j++)
			{
				Coupling(i, j) = Gamma(EnvironmentOrbitals[i], Frag.Sites[j]);
			}
		}

		Eigen::JacobiSVD< Eigen::MatrixXd > SVD(Coupling, Eigen::ComputeThinU);
		Eigen::VectorXd Sigma = SVD.singularValues();
		for (int k = 0; k < Sigma.size(); k++)
		{
			if (Sigma[k] <= Threshold) continue;
			BathCandidate Candidate;
			Candidate.SingularValue = Sigma[k];
			Candidate.Orbital = SVD.matrixU().col(k);
			int MaxIndex = 0;
			for (int i = 1; i < NumEnv; i++)
			{
				if (fabs(Candidate.Orbital[i]) > fabs(Candidate.Orbital[MaxIndex]) + 1E-12) MaxIndex = i;
			}
			if (Candidate.Orbital[MaxIndex] < 0) Candidate.Orbital = -Candidate.Orbital;
			Candidate.LargestSite = EnvironmentOrbitals[MaxIndex];
			Bath.push_back(Candidate);
		}
	}

	// Largest singular value first. Within a run of equal singular values, order by site.
	std::stable_sort(Bath.begin(), Bath.end(), [](const BathCandidate &a, const BathCandidate &b) { return a.SingularValue > b.SingularValue; });
	int RunStart = 0;
	for (int k = 1; k <= Bath.size(); k++)
	{
		if (k < Bath.size() && Bath[RunStart].SingularValue - Bath[k].SingularValue <= 1E-10 * std::max(1.0, Bath[RunStart].SingularValue)) continue;
		std::stable_sort(Bath.begin() + RunStart, Bath.begin() + k, [](const BathCandidate &a, const BathCandidate &b) { return a.LargestSite < b.LargestSite; });
		RunStart = k;
	}

	EmbeddingBasis Basis;
	Basis.FragmentId = Frag.Id;
	Basis.NumFragmentOrbitals = NumFragOrb;
	Basis.NumBath = Bath.size();
	Basis.TA = Eigen::MatrixXd::Zero(N, NumFragOrb + Basis.NumBath);
	Basis.SingularValues = Eigen::VectorXd::Zero(Basis.NumBath);
	for (int j = 0; j < NumFragOrb; j++)
	{
		Basis.TA(Frag.Sites[j], j) = 1.0;
	}
	for (int k = 0; k < Basis.NumBath; k++)
	{
		for (int i = 0; i < NumEnv; i++)
		{
			Basis.TA(EnvironmentOrbitals[i], NumFragOrb + k) = Bath[k].Orbital[i];
		}
		Basis.SingularValues[k] = Bath[k].SingularValue;
	}

	Eigen::MatrixXd DensityEmb = Basis.TA.transpose() * DensityLO * Basis.TA;
	double NumElectrons = DensityEmb.trace();
	int RoundedElectrons = (int)std::lround(NumElectrons);
	if (fabs(NumElectrons - RoundedElectrons) > 1E-6 || RoundedElectrons % 2 != 0)
	{
		throw SubspaceError("Embedding space of " + std::to_string(NumFragOrb) + " fragment and " + std::to_string(Basis.NumBath)
			+ " bath orbitals holds " + std::to_string(NumElectrons) + " electrons, not an even integer", Frag.Id);
	}
	if (RoundedElectrons > 2 * Basis.NumOrbitals())
	{
		throw SubspaceError("Embedding space is too small for its electrons", Frag.Id);
	}
	Eigen::MatrixXd Projector = Basis.TA * Basis.TA.transpose();
	Eigen::MatrixXd Leak = Basis.TA.transpose() * Gamma * (Eigen::MatrixXd::Identity(N, N) - Projector);
	if (Leak.size() > 0 && Leak.cwiseAbs().maxCoeff() > 1E-6)
	{
		throw SubspaceError("Density couples the embedding space to the rest of the system, the bath is incomplete", Frag.Id);
	}

	Basis.NumElectrons = RoundedElectrons;
	Basis.CoreDensity = DensityLO - Basis.TA * DensityEmb * Basis.TA.transpose();
	return Basis;
}

// Same decomposition starting from the atomic orbital density and overlap.
EmbeddingBasis SchmidtDecomposition(const Fragment &Frag, const Eigen::MatrixXd &DensityMatrix, const Eigen::MatrixXd &OverlapMatrix, double Threshold)
{
	Eigen::MatrixXd SHalf, SMinusHalf;
	LowdinOrthogonalization(OverlapMatrix, SHalf, SMinusHalf);
	Eigen::MatrixXd DensityLO = SHalf * DensityMatrix * SHalf;
	return SchmidtDecomposition(Frag, DensityLO, Threshold);
}

/* Position weighted sums of the embedding basis and of the site integrals. Two problems that differ in
   geometry, basis or interaction give different values, which is what keys the integral cache. */
double ERIFingerprint(const Eigen::MatrixXd &TA, const Eigen::Tensor<double, 4> &ERILO)
{
	double Stamp = 0;
	for (int i = 0; i < TA.rows(); i++)
	{
		for (int j = 0; j < TA.cols(); j++)
		{
			Stamp += TA(i, j) / (1.0 + i + 0.618 * j);
		}
	}
	const double *Data = ERILO.data();
	for (int k = 0; k < ERILO.size(); k++)
	{
		Stamp += Data[k] / (1.0 + 0.01 * k);
	}
	return Stamp;
}

/// <summary>
/// Projects the Hamiltonian into the embedding space of one fragment. The environment density enters
/// as a fixed core potential. The two electron part is read from the cache in ScratchDirectory
/// when a file for this fragment was built from the same basis and integrals, and written there otherwise.
/// </summary>
EmbeddedHamiltonian EmbedHamiltonian(const Fragment &Frag, const EmbeddingBasis &Basis, const Eigen::MatrixXd &HLO, const Eigen::MatrixXd &FockLO, const Eigen::MatrixXd &DensityLO,
                                     const Eigen::Tensor<double, 4> &ERILO, double ENuc, const std::string &ScratchDirectory)
{
	const Eigen::MatrixXd &TA = Basis.TA;
	int n = TA.cols();

	EmbeddedHamiltonian Ham;
	Ham.FragmentId = Frag.Id;
	Ham.NumOrbitals = n;
	Ham.NumElectrons = Basis.NumElectrons;
	Ham.HCore = TA.transpose() * HLO * TA;
	Ham.Fock = TA.transpose() * FockLO * TA;
	Ham.ReferenceDensity = TA.transpose() * DensityLO * TA;
	Ham.PotentialTerm = Eigen::MatrixXd::Zero(n, n);

	Eigen::MatrixXd VCore = CoulombExchange(Basis.CoreDensity, ERILO);
	Ham.CorePotential = TA.transpose() * VCore * TA;
	Ham.ECore = Basis.CoreDensity.cwiseProduct(HLO + 0.5 * VCore).sum() + ENuc;

	std::string CacheName;
	if (!ScratchDirectory.empty()) CacheName = ScratchDirectory + "/fragment" + std::to_string(Frag.Id) + ".eri";
	double Stamp = CacheName.empty() ? 0.0 : ERIFingerprint(TA, ERILO);
	if (CacheName.empty() || !ReadERICache(CacheName, Ham.TwoBody, n, Stamp))
	{
		Ham.TwoBody = TransformERI(ERILO, TA);
		if (!CacheName.empty()) WriteERICache(CacheName, Ham.TwoBody, Stamp);
	}
	return Ham;
}

// Copy of the bare Hamiltonian with the edge potential and the chemical potential on the one electron part.
EmbeddedHamiltonian AddCorrelationPotential(const EmbeddedHamiltonian &Bare, const Fragment &Frag, const CorrelationPotential &Potential)
{
	EmbeddedHamiltonian Ham(Bare);
	Ham.PotentialTerm = Eigen::MatrixXd::Zero(Bare.NumOrbitals, Bare.NumOrbitals);
	for (int e = 0; e < Frag.Edges.size(); e++)
	{
		const std::vector< int > &EdgeSites = Frag.Edges[e].Sites;
		for (int a = 0; a < EdgeSites.size(); a++)
		{
			for (int b = a; b < EdgeSites.size(); b++)
			{
				int k = Potential.Find(EdgeSites[a], EdgeSites[b]);
				if (k < 0) continue;
				int i = Frag.LocalIndex(EdgeSites[a]);
				int j = Frag.LocalIndex(EdgeSites[b]);
				Ham.PotentialTerm(i, j) = Potential.Values[k];
				Ham.PotentialTerm(j, i) = Potential.Values[k];
			}
		}
	}
	std::vector< int > CenterIndex = Frag.CenterIndex();
	for (int c = 0; c < CenterIndex.size(); c++)
	{
		Ham.PotentialTerm(CenterIndex[c], CenterIndex[c]) -= Potential.ChemicalPotential;
	}
	return Ham;
}
