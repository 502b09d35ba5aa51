#include <iostream>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <algorithm>
#include <iomanip>
#include <exception>
#include <functional>
#include <omp.h>

#include <boost/math/policies/error_handling.hpp>

#include "Bootstrap.h"
#include "Functions.h"
#include "NewtonRaphson.h"
#include "BEErrors.h"

MatchingMode ParseMatchingMode(const std::string &Name)
{
	if (Name == "none" || Name == "oneshot") return MatchingMode::None;
	if (Name == "chempot" || Name == "mu") return MatchingMode::ChemicalPotential;
	if (Name == "full") return MatchingMode::Full;
	throw ConfigurationError("Matching = " + Name + " not implemented!");
}

JacobianMethod ParseJacobianMethod(const std::string &Name)
{
	if (Name == "finite" || Name == "fd") return JacobianMethod::FiniteDifference;
	if (Name == "broyden") return JacobianMethod::Broyden;
	throw ConfigurationError("Jacobian = " + Name + " not implemented!");
}

std::string StatusName(MatchStatus Status)
{
	switch (Status)
	{
		case MatchStatus::Converged: return "converged";
		case MatchStatus::Stalled: return "stalled";
		case MatchStatus::Cancelled: return "cancelled";
		case MatchStatus::OneShot: return "one shot";
	}
	return "unknown";
}

// Exceptions of a parallel loop are kept per fragment. The first one in fragment order is thrown.
static void RethrowFirst(const std::vector< std::exception_ptr > &Errors)
{
	for (int i = 0; i < Errors.size(); i++)
	{
		if (Errors[i]) std::rethrow_exception(Errors[i]);
	}
}

void Bootstrap::Log(const std::string &Message) const
{
	std::cout << Message << std::endl;
	if (Output != nullptr) *Output << Message << std::endl;
}

/// <summary>
/// Moves the mean field into the orthogonalized site basis and builds, for every fragment, the
/// embedding basis and the Hamiltonian without potential. Those stay fixed for the rest of the run.
/// </summary>
/// <param name="MF">
/// Converged restricted reference of the whole system.
/// </param>
/// <param name="Fragments">
/// Fragments with sites indexing the basis of MF. MatchFullP must be set before this is called,
/// since it decides which potential keys exist.
/// </param>
void Bootstrap::Init(const MeanField &MF, const std::vector< Fragment > &Fragments, std::ofstream &OutStream)
{
	Output = &OutStream;
	if (!MF.Converged)
	{
		throw MeanFieldError("Reference HF Unconverged -- stopping the calculation");
	}
	NumAO = MF.NumAO;
	NumElectrons = MF.NumElectrons;
	EHF = MF.EHF;
	ENuc = MF.ENuc;
	Frags = Fragments;
	NumFrag = Frags.size();
	for (int x = 0; x < NumFrag; x++)
	{
		for (int i = 0; i < Frags[x].Sites.size(); i++)
		{
			if (Frags[x].Sites[i] < 0 || Frags[x].Sites[i] >= NumAO)
			{
				throw ConfigurationError("Fragment " + std::to_string(x) + " refers to site " + std::to_string(Frags[x].Sites[i]) + " but there are " + std::to_string(NumAO) + " orbitals");
			}
		}
	}

	double Timer = omp_get_wtime();
	Eigen::MatrixXd SHalf, SMinusHalf;
	LowdinOrthogonalization(MF.OverlapMatrix, SHalf, SMinusHalf);
	HLO = SMinusHalf * MF.HCore * SMinusHalf;
	FockLO = SMinusHalf * MF.FockMatrix * SMinusHalf;
	DensityLO = SHalf * MF.DensityMatrix * SHalf;
	ERILO = TransformERI(MF.ERI, SMinusHalf);

	Bases.assign(NumFrag, EmbeddingBasis());
	BareHamiltonians.assign(NumFrag, EmbeddedHamiltonian());
	ReferenceEnergies.assign(NumFrag, 0.0);
	std::vector< std::exception_ptr > Errors(NumFrag);
	std::vector< std::string > Messages(NumFrag);
	#pragma omp parallel for schedule(dynamic)
	for (int x = 0; x < NumFrag; x++)
	{
		try
		{
			Bases[x] = SchmidtDecomposition(Frags[x], DensityLO, BathThreshold);
			BareHamiltonians[x] = EmbedHamiltonian(Frags[x], Bases[x], HLO, FockLO, DensityLO, ERILO, ENuc, ScratchDirectory);
			const Eigen::MatrixXd &D = BareHamiltonians[x].ReferenceDensity;
			ReferenceEnergies[x] = EmbeddedEnergy(BareHamiltonians[x], D, MeanFieldTwoRDM(D));
		}
		catch (const BEError &Error)
		{
			Messages[x] = Error.what();
			Errors[x] = std::current_exception();
		}
		catch (...)
		{
			Errors[x] = std::current_exception();
		}
	}
	for (int x = 0; x < NumFrag; x++)
	{
		if (!Messages[x].empty()) Log("BE-DMET: Error: " + Messages[x]);
	}
	RethrowFirst(Errors);

	for (int x = 0; x < NumFrag; x++)
	{
		std::stringstream Message;
		Message << "BE-DMET: Fragment " << x << " has " << Bases[x].NumFragmentOrbitals << " fragment and " << Bases[x].NumBath << " bath orbitals with "
		        << Bases[x].NumElectrons << " electrons.";
		Log(Message.str());
	}
	std::stringstream TimeMessage;
	TimeMessage << "BE-DMET: Embedding spaces built in " << (omp_get_wtime() - Timer) << " seconds.";
	Log(TimeMessage.str());

	CorrelationPotential Potential;
	Potential.InitFromFragments(Frags, MatchFullP);
	PotentialHistory.clear();
	PotentialHistory.push_back(Potential);
	Results.assign(NumFrag, FragmentResult());
	ResidualHistory.clear();
	Iteration = 0;
	Status = MatchStatus::Stalled;
}

void Bootstrap::InitFromFragmenting(const MeanField &MF, const Fragmenting &Fragments, std::ofstream &OutStream)
{
	Init(MF, Fragments.Frags, OutStream);
}

// Starts from a given potential, usually read back from a restart file.
void Bootstrap::SetPotential(const CorrelationPotential &Potential)
{
	if (PotentialHistory.empty() || Potential.Keys != PotentialHistory.back().Keys)
	{
		throw ConfigurationError("Potential does not fit the edges of this fragmentation");
	}
	PotentialHistory.push_back(Potential);
}

std::vector< int > Bootstrap::AllFragments() const
{
	std::vector< int > Which(NumFrag);
	for (int x = 0; x < NumFrag; x++) Which[x] = x;
	return Which;
}

// Fragments in which an edge potential on Atom enters the Hamiltonian.
std::vector< int > Bootstrap::FragmentsWithEdge(int Atom) const
{
	std::vector< int > Which;
	for (int x = 0; x < NumFrag; x++)
	{
		if (std::find(Frags[x].EdgeAtoms.begin(), Frags[x].EdgeAtoms.end(), Atom) != Frags[x].EdgeAtoms.end()) Which.push_back(x);
	}
	return Which;
}

/* Solves the fragments listed in Which under Potential and stores them in Out, which has one entry
   per fragment. The fragments are independent and solved in parallel. */
void Bootstrap::SolveFragments(const ImpuritySolver &Solver, const CorrelationPotential &Potential, const std::vector< int > &Which, std::vector< FragmentResult > &Out) const
{
	int NumWhich = Which.size();
	std::vector< std::exception_ptr > Errors(NumWhich);
	#pragma omp parallel for schedule(dynamic)
	for (int w = 0; w < NumWhich; w++)
	{
		int x = Which[w];
		try
		{
			EmbeddedHamiltonian Ham = AddCorrelationPotential(BareHamiltonians[x], Frags[x], Potential);
			SolverResult Solved = Solver.Solve(Ham);
			if (!Solved.Converged)
			{
				throw SolverDivergence(Solver.Name() + " solver did not converge in " + std::to_string(Solved.Iterations) + " iterations", Frags[x].Id, Iteration);
			}
			FragmentResult &Result = Out[x];
			Result.Energy = Solved.Energy;
			Result.EmbeddedHFEnergy = ReferenceEnergies[x];
			Result.CorrelationEnergy = Solved.CorrelationEnergy;
			Result.OneRDM = Solved.OneRDM;
			Result.TwoRDM = Solved.TwoRDM;
			Result.PotentialVersion = Potential.Version;
			Result.Converged = Solved.Converged;
			Result.Iterations = Solved.Iterations;
		}
		catch (...)
		{
			Errors[w] = std::current_exception();
		}
	}
	RethrowFirst(Errors);
}

// sum_F sum_c w_c D_F[c, c] - N over the center sites of every fragment.
double Bootstrap::NumberResidual(const std::vector< FragmentResult > &Solved) const
{
	double N = 0;
	for (int x = 0; x < NumFrag; x++)
	{
		for (int a = 0; a < Frags[x].Sites.size(); a++)
		{
			if (Frags[x].Weights[a] == 0) continue;
			N += Frags[x].Weights[a] * Solved[x].OneRDM(a, a);
		}
	}
	return N - NumElectrons;
}

/* Mismatch of every edge density element with the same element in the fragment that has the atom
   as a center, in fragment order, then edge order, then site pair order. Only diagonal elements are
   compared unless MatchFullP is set. The particle number residual is the last entry. */
Eigen::VectorXd Bootstrap::CalcResidual(const std::vector< FragmentResult > &Solved) const
{
	std::vector< double > Losses;
	for (int x = 0; x < NumFrag; x++)
	{
		for (int e = 0; e < Frags[x].Edges.size(); e++)
		{
			const EdgeGroup &Edge = Frags[x].Edges[e];
			const Fragment &Owner = Frags[Edge.Owner];
			for (int a = 0; a < Edge.Sites.size(); a++)
			{
				for (int b = a; b < Edge.Sites.size(); b++)
				{
					if (!MatchFullP && a != b) continue;
					int i = Edge.Sites[a];
					int j = Edge.Sites[b];
					double Loss = Solved[x].OneRDM(Frags[x].LocalIndex(i), Frags[x].LocalIndex(j))
					            - Solved[Edge.Owner].OneRDM(Owner.LocalIndex(i), Owner.LocalIndex(j));
					Losses.push_back(Loss);
				}
			}
		}
	}
	Losses.push_back(NumberResidual(Solved));
	return Eigen::Map< Eigen::VectorXd >(Losses.data(), Losses.size());
}

// The part of the residual that the current mode drives to zero.
Eigen::VectorXd Bootstrap::MatchResidual(const std::vector< FragmentResult > &Solved) const
{
	if (Matching == MatchingMode::ChemicalPotential)
	{
		Eigen::VectorXd f(1);
		f[0] = NumberResidual(Solved);
		return f;
	}
	return CalcResidual(Solved);
}

double Bootstrap::ResidualNorm(const Eigen::VectorXd &f) const
{
	if (Matching == MatchingMode::ChemicalPotential) return fabs(f[0]);
	return sqrt(f.squaredNorm() / f.size());
}

/* Jacobian of the matched residual with respect to the parameter vector, by central differences.
   A site potential only enters the fragments that have its atom as an edge, so only those are
   solved again. The chemical potential enters every fragment. */
Eigen::MatrixXd Bootstrap::CalcJacobian(const ImpuritySolver &Solver, const Eigen::VectorXd &x, const Eigen::VectorXd &f)
{
	bool WithSite = (Matching == MatchingMode::Full);
	const CorrelationPotential &Base = CurrentPotential();
	Eigen::MatrixXd J = Eigen::MatrixXd::Zero(f.size(), x.size());

	// Jacobian is
	// [ df1/dx1, ..., df1/dxn ]
	// [ ..................... ]
	// [ dfm/dx1, ..., dfm/dxn ]
	// fi are the edge and particle number residuals
	// xi are the edge potentials followed by the chemical potential
	for (int p = 0; p < x.size(); p++)
	{
		std::vector< int > Which;
		if (WithSite && p < Base.NumKeys()) Which = FragmentsWithEdge(Base.KeyAtom[p]);
		else Which = AllFragments();

		Eigen::VectorXd xPlus = x;
		Eigen::VectorXd xMins = x;
		xPlus[p] += dLambda;
		xMins[p] -= dLambda;
		std::vector< FragmentResult > ResultsPlus(Results), ResultsMins(Results);
		SolveFragments(Solver, Base.FromVector(xPlus, WithSite), Which, ResultsPlus);
		SolveFragments(Solver, Base.FromVector(xMins, WithSite), Which, ResultsMins);
		J.col(p) = (MatchResidual(ResultsPlus) - MatchResidual(ResultsMins)) / (dLambda + dLambda);
	}
	return J;
}

// Chemical potential alone, found by Newton-Raphson root finding before the site potential is matched.
void Bootstrap::OptMu(const ImpuritySolver &Solver)
{
	Log("BE-DMET: Optimizing chemical potential.");
	std::function< double(double) > Residual = [this, &Solver](double Mu)
	{
		Eigen::VectorXd x = CurrentPotential().ToVector(false);
		x[0] = Mu;
		std::vector< FragmentResult > Trial(Results);
		SolveFragments(Solver, CurrentPotential().FromVector(x, false), AllFragments(), Trial);
		double Loss = NumberResidual(Trial);
		std::stringstream Message;
		Message << "BE-DMET: Mu = " << Mu << " and Mu Loss = " << Loss;
		Log(Message.str());
		return Loss;
	};

	int MuIterations = 50;
	double Mu;
	try
	{
		Mu = SolveChemicalPotential(Residual, CurrentPotential().ChemicalPotential, MuBound, dMu, Tolerance, MuIterations);
	}
	catch (const boost::math::evaluation_error &Error)
	{
		Log(std::string("BE-DMET: Warning: chemical potential search failed, keeping the previous value. ") + Error.what());
		return;
	}
	Eigen::VectorXd x = CurrentPotential().ToVector(false);
	x[0] = Mu;
	PotentialHistory.push_back(CurrentPotential().FromVector(x, false));
	std::stringstream Message;
	Message << "BE-DMET: Chemical Potential = " << Mu << " after " << MuIterations << " iterations.";
	Log(Message.str());
}

/// <summary>
/// Runs the matching loop: solve all fragments under the current potential, compare the edge densities,
/// stop if they agree, otherwise take a quasi-Newton step on the potential. With the trust region a
/// step that makes the residual worse is undone and retried with a smaller radius.
/// </summary>
BEResult Bootstrap::doBootstrap(const ImpuritySolver &Solver)
{
	if (PotentialHistory.empty())
	{
		throw BEError("Bootstrap::Init must be called before doBootstrap");
	}
	Log("BE-DMET: Beginning Bootstrap Embedding with the " + Solver.Name() + " solver.");
	bool WithSite = (Matching == MatchingMode::Full);
	ResidualHistory.clear();
	Results.assign(NumFrag, FragmentResult());
	Iteration = 0;
	Status = MatchStatus::Stalled;

	if (Matching == MatchingMode::Full && PrefitMu && MaxIterations > 0 && !(Cancel && Cancel(Iteration)))
	{
		OptMu(Solver);
	}

	NewtonRaphson NR;
	NR.UseTrustRegion = UseTrustRegion;
	NR.TrustRadius = TrustRadius;
	NR.MaxTrustRadius = MaxTrustRadius;
	bool HaveStep = false;
	bool NeedJacobian = true;
	std::vector< FragmentResult > AcceptedResults;

	while (true)
	{
		if (Cancel && Cancel(Iteration))
		{
			Status = MatchStatus::Cancelled;
			break;
		}

		Log("BE-DMET: -- Running Newton-Raphson iteration " + std::to_string(Iteration + 1) + ".");
		double Timer = omp_get_wtime();
		SolveFragments(Solver, CurrentPotential(), AllFragments(), Results);
		Iteration++;
		for (int x = 0; x < NumFrag; x++)
		{
			std::stringstream Message;
			Message << Solver.Name() << ": Fragment " << x << " energy = " << std::setprecision(10) << Results[x].Energy << " (" << Results[x].Iterations << " iterations)";
			Log(Message.str());
		}

		Eigen::VectorXd f = MatchResidual(Results);
		double Norm = ResidualNorm(f);

		if (Matching == MatchingMode::None)
		{
			ResidualHistory.push_back(Norm);
			std::stringstream Message;
			Message << "BE-DMET: Lambda Loss = " << Norm;
			Log(Message.str());
			Status = MatchStatus::OneShot;
			break;
		}

		bool Accept = true;
		if (HaveStep)
		{
			if (UseTrustRegion)
			{
				double Rho = NR.UpdateTrustRadius(f);
				Accept = (Rho > 0);
				std::stringstream Message;
				Message << "BE-DMET: Step quality = " << Rho << " and trust radius = " << NR.TrustRadius;
				Log(Message.str());
			}
			if (Jacobian == JacobianMethod::Broyden) NR.BroydenUpdate(f);
			if (Accept)
			{
				NR.x += NR.dx;
				NR.f = f;
				if (Jacobian == JacobianMethod::FiniteDifference) NeedJacobian = true;
			}
			else
			{
				Log("BE-DMET: Step rejected, returning to the previous potential.");
				Results = AcceptedResults;
				PotentialHistory.push_back(CurrentPotential().FromVector(NR.x, WithSite));
				Norm = ResidualNorm(NR.f);
			}
		}
		else
		{
			NR.x = CurrentPotential().ToVector(WithSite);
			NR.f = f;
		}
		if (Accept)
		{
			ResidualHistory.push_back(Norm);
			AcceptedResults = Results;
		}
		std::stringstream LossMessage;
		LossMessage << "BE-DMET: Lambda Loss = " << Norm << " (" << (omp_get_wtime() - Timer) << " seconds)";
		Log(LossMessage.str());

		if (Cancel && Cancel(Iteration))
		{
			Status = MatchStatus::Cancelled;
			break;
		}
		if (Iteration <= MaxIterations && Norm < Tolerance)
		{
			Status = MatchStatus::Converged;
			break;
		}
		if (Iteration >= MaxIterations)
		{
			Status = MatchStatus::Stalled;
			break;
		}

		if (NeedJacobian)
		{
			NR.J = CalcJacobian(Solver, NR.x, NR.f);
			NeedJacobian = false;
		}
		if (!NR.doNewton())
		{
			Log("BE-DMET: Jacobian has no significant singular value, no step can be taken.");
			Status = MatchStatus::Stalled;
			break;
		}
		PotentialHistory.push_back(CurrentPotential().FromVector(NR.x + NR.dx, WithSite));
		HaveStep = true;
	}

	if (Status == MatchStatus::Stalled)
	{
		Log("BE-DMET: Warning: potential matching stalled after " + std::to_string(Iteration) + " iterations.");
	}
	Log("BE-DMET: Matching " + StatusName(Status) + ".");
	CurrentPotential().PrintPotential(*Output);

	BEResult Result = CollectResult();
	PrintEnergy(Result.Components, std::cout);
	PrintEnergy(Result.Components, *Output);
	return Result;
}

// Energy of the last accepted solution. Fragments that were never solved contribute their reference density.
BEResult Bootstrap::CollectResult() const
{
	BEResult Result;
	std::vector< Eigen::MatrixXd > OneRDMs(NumFrag);
	std::vector< Eigen::Tensor<double, 4> > TwoRDMs(NumFrag);
	for (int x = 0; x < NumFrag; x++)
	{
		if (Results[x].OneRDM.size() == 0)
		{
			OneRDMs[x] = BareHamiltonians[x].ReferenceDensity;
			TwoRDMs[x] = MeanFieldTwoRDM(OneRDMs[x]);
			continue;
		}
		OneRDMs[x] = Results[x].OneRDM;
		TwoRDMs[x] = Results[x].TwoRDM;
	}
	Result.Components = AssembleEnergy(Frags, BareHamiltonians, OneRDMs, TwoRDMs, EHF, ENuc, Expression);
	Result.Energy = Result.Components.Total;
	Result.CorrelationEnergy = Result.Components.Correlation;
	Result.Status = Status;
	Result.Iterations = Iteration;
	Result.ResidualNorm = ResidualHistory.empty() ? 0 : ResidualHistory.back();
	Result.Potential = CurrentPotential();
	Result.Fragments = Results;
	return Result;
}

/* Writes the Hamiltonian each fragment is solved with, under the current potential, to
   <Prefix>frag<id>.FCIDUMP. With MOBasis the integrals are rotated into the Hartree-Fock orbitals
   of the embedded problem first. */
void Bootstrap::ExportFCIDUMP(const std::string &Prefix, bool MOBasis) const
{
	for (int x = 0; x < NumFrag; x++)
	{
		EmbeddedHamiltonian Ham = AddCorrelationPotential(BareHamiltonians[x], Frags[x], CurrentPotential());
		Eigen::MatrixXd h = Ham.OneBody();
		Eigen::Tensor<double, 4> V = Ham.TwoBody;
		if (MOBasis)
		{
			int n = Ham.NumOrbitals;
			Eigen::MatrixXd D = Ham.ReferenceDensity;
			Eigen::MatrixXd F, C;
			Eigen::VectorXd EV;
			double Energy = 0;
			int SCFCount = 0;
			if (!SCF(h, Eigen::MatrixXd::Identity(n, n), V, Ham.NumElectrons / 2, D, F, C, EV, Energy, 500, 1E-10, SCFCount))
			{
				throw SolverDivergence("Embedded HF for the FCIDUMP export did not converge", Frags[x].Id, Iteration);
			}
			h = C.transpose() * h * C;
			V = TransformERI(V, C);
		}
		std::string FileName = Prefix + "frag" + std::to_string(Frags[x].Id) + ".FCIDUMP";
		WriteFCIDUMP(FileName, h, V, Ham.ECore, Ham.NumElectrons);
		Log("BE-DMET: Wrote " + FileName);
	}
}
