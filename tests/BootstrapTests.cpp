#include <catch2/catch.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Bootstrap.h"
#include "FCI.h"
#include "Solver.h"
#include "Functions.h"
#include "BEErrors.h"
#include "TestSystems.h"

// Never converges; used to check how a failing fragment is reported.
class StuckSolver : public ImpuritySolver
{
public:
	SolverResult Solve(const EmbeddedHamiltonian &Ham) const
	{
		SolverResult Result;
		Result.OneRDM = Ham.ReferenceDensity;
		Result.TwoRDM = MeanFieldTwoRDM(Ham.ReferenceDensity);
		Result.Converged = false;
		Result.Iterations = 7;
		return Result;
	}
	std::string Name() const { return "Stuck"; }
};

// Away from half filling, so that particle-hole symmetry does not match the edges for free.
static MeanField DopedChain()
{
	return HubbardChainMeanField(8, 2.0, 1.0, 6);
}

static void SetUp(Bootstrap &BE, const MeanField &MF, PartitionStrategy Strategy, int Order)
{
	Fragmenting Frag = HubbardChainFragments(MF.NumAO, Strategy, Order);
	BE.InitFromFragmenting(MF, Frag, NullOutput());
}

TEST_CASE("Matching options by name", "[bootstrap]")
{
	REQUIRE(ParseMatchingMode("oneshot") == MatchingMode::None);
	REQUIRE(ParseMatchingMode("mu") == MatchingMode::ChemicalPotential);
	REQUIRE(ParseMatchingMode("full") == MatchingMode::Full);
	REQUIRE(ParseJacobianMethod("broyden") == JacobianMethod::Broyden);
	REQUIRE_THROWS_AS(ParseMatchingMode("partial"), ConfigurationError);
	REQUIRE_THROWS_AS(ParseJacobianMethod("exact"), ConfigurationError);
	REQUIRE(StatusName(MatchStatus::OneShot) == "one shot");
}

TEST_CASE("HF in HF matches at once and reproduces the reference energy", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(8, 2.0);
	for (int Order = 1; Order <= 2; Order++)
	{
		Bootstrap BE;
		SetUp(BE, MF, PartitionStrategy::Autogen, Order);
		EmbeddedHF Solver;
		BEResult Result = BE.doBootstrap(Solver);
		REQUIRE(Result.Status == MatchStatus::Converged);
		REQUIRE(Result.Iterations == 1);
		REQUIRE(Result.ResidualNorm < 1E-6);
		REQUIRE(Result.Energy == Approx(MF.EHF).margin(1E-6));
		REQUIRE(Result.CorrelationEnergy == Approx(0.0).margin(1E-6));
		REQUIRE(Result.Fragments.size() == BE.NumFrag);
		REQUIRE(std::fabs(BE.NumberResidual(BE.Results)) < 1E-6);
	}
}

TEST_CASE("Without matching the fragments are solved once", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.Matching = MatchingMode::None;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	FCI Solver;
	BEResult Result = BE.doBootstrap(Solver);
	REQUIRE(Result.Status == MatchStatus::OneShot);
	REQUIRE(Result.Iterations == 1);
	REQUIRE(BE.ResidualHistory.size() == 1);
	REQUIRE(BE.PotentialHistory.size() == 1);

	std::vector< Eigen::MatrixXd > OneRDMs;
	std::vector< Eigen::Tensor<double, 4> > TwoRDMs;
	for (int x = 0; x < BE.NumFrag; x++)
	{
		SolverResult Direct = Solver.Solve(BE.BareHamiltonians[x]);
		OneRDMs.push_back(Direct.OneRDM);
		TwoRDMs.push_back(Direct.TwoRDM);
		REQUIRE(Result.Fragments[x].Energy == Approx(Direct.Energy));
		REQUIRE(Result.Fragments[x].PotentialVersion == 0);
	}
	BEEnergy Expected = AssembleEnergy(BE.Frags, BE.BareHamiltonians, OneRDMs, TwoRDMs, MF.EHF, MF.ENuc, EnergyExpression::NonCumulant);
	REQUIRE(Result.Energy == Approx(Expected.Total));
}

TEST_CASE("One whole-system fragment without matching is the direct solver", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(6, 4.0);
	FCI Solver;
	SolverResult Direct = Solver.Solve(WholeSystemHamiltonian(MF));

	std::vector< Fragment > Whole(1, WholeSystemFragment(6));
	Bootstrap NonCumulant;
	NonCumulant.Matching = MatchingMode::None;
	NonCumulant.Init(MF, Whole, NullOutput());
	BEResult Result = NonCumulant.doBootstrap(Solver);
	REQUIRE(Result.Status == MatchStatus::OneShot);
	REQUIRE(Result.Energy == Approx(Direct.Energy).margin(1E-8));

	Bootstrap Cumulant;
	Cumulant.Matching = MatchingMode::None;
	Cumulant.Expression = EnergyExpression::Cumulant;
	Cumulant.Init(MF, Whole, NullOutput());
	REQUIRE(Cumulant.doBootstrap(Solver).Energy == Approx(Direct.Energy).margin(1E-7));
}

TEST_CASE("No iterations allowed means a single solve and a stall", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(8, 2.0);
	Bootstrap BE;
	BE.MaxIterations = 0;
	SetUp(BE, MF, PartitionStrategy::Autogen, 1);
	EmbeddedHF Solver;
	BEResult Result = BE.doBootstrap(Solver);
	REQUIRE(Result.Status == MatchStatus::Stalled);
	REQUIRE(Result.Iterations == 1);
	REQUIRE(BE.PotentialHistory.size() == 1);
}

TEST_CASE("Full matching converges for a Hubbard chain", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.PrefitMu = false;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	FCI Solver;
	BEResult Result = BE.doBootstrap(Solver);

	REQUIRE(Result.Status == MatchStatus::Converged);
	REQUIRE(Result.ResidualNorm < BE.Tolerance);
	REQUIRE(BE.ResidualHistory.size() >= 2);
	REQUIRE(BE.ResidualHistory.back() < BE.ResidualHistory.front());
	REQUIRE(Result.CorrelationEnergy < 0);
	REQUIRE(std::fabs(BE.NumberResidual(BE.Results)) < 1E-5);

	// Every fragment was solved with the final potential, and versions only grow.
	for (int x = 0; x < BE.NumFrag; x++) REQUIRE(Result.Fragments[x].PotentialVersion <= Result.Potential.Version);
	for (int v = 1; v < BE.PotentialHistory.size(); v++) REQUIRE(BE.PotentialHistory[v].Version > BE.PotentialHistory[v - 1].Version);
	REQUIRE(Result.Potential.Values.norm() > 0);

	// Matched edges: each edge density agrees with its owner's center density.
	Eigen::VectorXd f = BE.CalcResidual(BE.Results);
	REQUIRE(f.size() == Result.Potential.NumKeys() + 1);
	REQUIRE(f.cwiseAbs().maxCoeff() < 1E-5);
}

TEST_CASE("Fragments sharing an edge keep one potential value through the updates", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.PrefitMu = false;
	BE.MaxIterations = 3;
	SetUp(BE, MF, PartitionStrategy::Autogen, 1);
	FCI Solver;
	BEResult Result = BE.doBootstrap(Solver);
	REQUIRE(Result.Status != MatchStatus::Cancelled);
	REQUIRE(BE.PotentialHistory.size() > 1);

	// Residual has more entries than parameters here: edges 2 to 5 appear in two fragments each.
	REQUIRE(BE.CalcResidual(BE.Results).size() == 11);
	for (int Atom = 1; Atom <= 6; Atom++)
	{
		double Shared = Result.Potential.Value(Atom, Atom);
		for (int x = 0; x < BE.NumFrag; x++)
		{
			const Fragment &F = BE.Frags[x];
			if (F.isCenterAtom(Atom) || F.LocalIndex(Atom) < 0) continue;
			EmbeddedHamiltonian Ham = AddCorrelationPotential(BE.BareHamiltonians[x], F, Result.Potential);
			int i = F.LocalIndex(Atom);
			REQUIRE(Ham.PotentialTerm(i, i) == Shared);
		}
	}
}

TEST_CASE("Jacobian updates and trust region reach the same solution", "[bootstrap]")
{
	MeanField MF = DopedChain();
	FCI Solver;

	Bootstrap Reference;
	Reference.PrefitMu = false;
	SetUp(Reference, MF, PartitionStrategy::Chain, 1);
	BEResult Expected = Reference.doBootstrap(Solver);
	REQUIRE(Expected.Status == MatchStatus::Converged);

	Bootstrap Broyden;
	Broyden.PrefitMu = false;
	Broyden.Jacobian = JacobianMethod::Broyden;
	SetUp(Broyden, MF, PartitionStrategy::Chain, 1);
	BEResult BroydenResult = Broyden.doBootstrap(Solver);
	REQUIRE(BroydenResult.Status == MatchStatus::Converged);
	REQUIRE(BroydenResult.Energy == Approx(Expected.Energy).margin(1E-5));

	Bootstrap NoTrust;
	NoTrust.PrefitMu = false;
	NoTrust.UseTrustRegion = false;
	SetUp(NoTrust, MF, PartitionStrategy::Chain, 1);
	BEResult NoTrustResult = NoTrust.doBootstrap(Solver);
	REQUIRE(NoTrustResult.Status == MatchStatus::Converged);
	REQUIRE(NoTrustResult.Energy == Approx(Expected.Energy).margin(1E-5));
	REQUIRE((NoTrustResult.Potential.Values - Expected.Potential.Values).norm() < 1E-3);
}

TEST_CASE("Chemical potential matching fixes the particle number only", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.Matching = MatchingMode::ChemicalPotential;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	FCI Solver;
	BEResult Result = BE.doBootstrap(Solver);
	REQUIRE(Result.Status == MatchStatus::Converged);
	REQUIRE(std::fabs(BE.NumberResidual(BE.Results)) < BE.Tolerance);
	REQUIRE(Result.Potential.Values.norm() == 0.0);
}

TEST_CASE("The chemical potential prefit", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.MaxIterations = 1;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	FCI Solver;
	BEResult Result = BE.doBootstrap(Solver);
	REQUIRE(Result.Iterations == 1);
	REQUIRE(std::fabs(BE.NumberResidual(BE.Results)) < 1E-4);
}

TEST_CASE("Cancellation is honored at solve and compare boundaries", "[bootstrap]")
{
	MeanField MF = DopedChain();
	FCI Solver;

	Bootstrap Immediate;
	Immediate.Cancel = [](int) { return true; };
	SetUp(Immediate, MF, PartitionStrategy::Chain, 1);
	BEResult Never = Immediate.doBootstrap(Solver);
	REQUIRE(Never.Status == MatchStatus::Cancelled);
	REQUIRE(Never.Iterations == 0);
	// Nothing was solved, so the reference densities give back the mean field energy.
	REQUIRE(Never.Energy == Approx(MF.EHF).margin(1E-8));

	Bootstrap AfterOne;
	AfterOne.PrefitMu = false;
	std::vector< int > Asked;
	AfterOne.Cancel = [&Asked](int Iteration) { Asked.push_back(Iteration); return Iteration >= 1; };
	SetUp(AfterOne, MF, PartitionStrategy::Chain, 1);
	BEResult Once = AfterOne.doBootstrap(Solver);
	REQUIRE(Once.Status == MatchStatus::Cancelled);
	REQUIRE(Once.Iterations == 1);
	REQUIRE(Asked == std::vector< int >({ 0, 1 }));
	REQUIRE(AfterOne.ResidualHistory.size() == 1);
}

TEST_CASE("A fragment solver that does not converge stops the run", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.PrefitMu = false;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	StuckSolver Solver;
	bool Thrown = false;
	try
	{
		BE.doBootstrap(Solver);
	}
	catch (const SolverDivergence &Error)
	{
		Thrown = true;
		REQUIRE(Error.FragmentId == 0);
		REQUIRE(Error.Iteration == 0);
		REQUIRE_THAT(std::string(Error.what()), Catch::Contains("Stuck solver did not converge in 7 iterations"));
	}
	REQUIRE(Thrown);
}

TEST_CASE("An unconverged reference is refused", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(4, 2.0);
	MF.Converged = false;
	Fragmenting Frag = HubbardChainFragments(4, PartitionStrategy::Chain, 1);
	Bootstrap BE;
	REQUIRE_THROWS_AS(BE.Init(MF, Frag.Frags, NullOutput()), MeanFieldError);

	Bootstrap NotReady;
	EmbeddedHF Solver;
	REQUIRE_THROWS_AS(NotReady.doBootstrap(Solver), BEError);
}

TEST_CASE("Progress goes to the output file as well as the console", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(8, 2.0);
	Fragmenting Frag = HubbardChainFragments(8, PartitionStrategy::Autogen, 1);
	std::string LogName = "bootstrap_test_progress.out";
	std::ofstream LogFile(LogName.c_str());
	Bootstrap BE;
	BE.Init(MF, Frag.Frags, LogFile);
	EmbeddedHF Solver;
	BE.doBootstrap(Solver);
	LogFile.close();

	std::ifstream Logged(LogName.c_str());
	std::string Line;
	bool Sizes = false, Timing = false, Loss = false, Energies = false;
	while (std::getline(Logged, Line))
	{
		if (Line.find("BE-DMET: Fragment 0 has") != std::string::npos) Sizes = true;
		if (Line.find("BE-DMET: Embedding spaces built in") != std::string::npos) Timing = true;
		if (Line.find("BE-DMET: Lambda Loss =") != std::string::npos && Line.find("seconds") != std::string::npos) Loss = true;
		if (Line.find(Solver.Name() + ": Fragment 0 energy =") != std::string::npos && Line.find("iterations") != std::string::npos) Energies = true;
	}
	Logged.close();
	std::remove(LogName.c_str());
	REQUIRE(Sizes);
	REQUIRE(Timing);
	REQUIRE(Loss);
	REQUIRE(Energies);
}

TEST_CASE("Every fragment is embedded before the first subspace failure is reported", "[bootstrap]")
{
	// Sites 0 to 3 carry the density of a closed four site chain. Sites 4 to 9 hold half an electron
	// each and couple to nothing, so every window that reaches past site 3 has a fractional or odd count.
	MeanField MF = HubbardChainMeanField(10, 2.0);
	MeanField Closed = HubbardChainMeanField(4, 0.0);
	MF.DensityMatrix.setZero();
	MF.DensityMatrix.topLeftCorner(4, 4) = Closed.DensityMatrix;
	for (int i = 4; i < 10; i++) MF.DensityMatrix(i, i) = 0.5;

	Fragmenting Frag = HubbardChainFragments(10, PartitionStrategy::Chain, 2);
	REQUIRE(Frag.Frags.size() == 8);
	REQUIRE_NOTHROW(SchmidtDecomposition(Frag.Frags[0], MF.DensityMatrix));
	REQUIRE_NOTHROW(SchmidtDecomposition(Frag.Frags[1], MF.DensityMatrix));
	REQUIRE_THROWS_AS(SchmidtDecomposition(Frag.Frags[5], MF.DensityMatrix), SubspaceError);

	std::string LogName = "bootstrap_test_subspace.out";
	std::ofstream LogFile(LogName.c_str());
	Bootstrap BE;
	int Thrown = -1;
	try
	{
		BE.Init(MF, Frag.Frags, LogFile);
	}
	catch (const SubspaceError &Error)
	{
		Thrown = Error.FragmentId;
	}
	LogFile.close();
	REQUIRE(Thrown == 2);

	std::ifstream Logged(LogName.c_str());
	std::string Line;
	std::vector< bool > Reported(Frag.Frags.size(), false);
	while (std::getline(Logged, Line))
	{
		for (int x = 0; x < Frag.Frags.size(); x++)
		{
			if (Line.find("BE-DMET: Error:") != std::string::npos && Line.find("(fragment " + std::to_string(x) + ",") != std::string::npos) Reported[x] = true;
		}
	}
	Logged.close();
	std::remove(LogName.c_str());
	REQUIRE_FALSE(Reported[0]);
	REQUIRE_FALSE(Reported[1]);
	for (int x = 2; x < Frag.Frags.size(); x++) REQUIRE(Reported[x]);
}

TEST_CASE("Fragments must refer to existing sites", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(4, 2.0);
	Fragmenting Frag = HubbardChainFragments(6, PartitionStrategy::Chain, 1);
	Bootstrap BE;
	REQUIRE_THROWS_AS(BE.Init(MF, Frag.Frags, NullOutput()), ConfigurationError);
}

TEST_CASE("Restarting from a potential", "[bootstrap]")
{
	MeanField MF = DopedChain();
	Bootstrap BE;
	BE.PrefitMu = false;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	FCI Solver;
	BEResult First = BE.doBootstrap(Solver);
	REQUIRE(First.Status == MatchStatus::Converged);

	Bootstrap Restart;
	Restart.PrefitMu = false;
	SetUp(Restart, MF, PartitionStrategy::Chain, 1);
	Restart.SetPotential(First.Potential);
	BEResult Second = Restart.doBootstrap(Solver);
	REQUIRE(Second.Status == MatchStatus::Converged);
	REQUIRE(Second.Iterations <= 2);
	REQUIRE(Second.Energy == Approx(First.Energy).margin(1E-6));

	CorrelationPotential Other;
	Other.InitFromFragments(HubbardChainFragments(6, PartitionStrategy::Autogen, 1).Frags, false);
	REQUIRE_THROWS_AS(Restart.SetPotential(Other), ConfigurationError);
}

TEST_CASE("Fragment Hamiltonians are written as FCIDUMP files", "[bootstrap]")
{
	MeanField MF = HubbardChainMeanField(4, 2.0);
	Bootstrap BE;
	SetUp(BE, MF, PartitionStrategy::Chain, 1);
	BE.ExportFCIDUMP("bootstrap_test_", false);

	for (int x = 0; x < BE.NumFrag; x++)
	{
		std::string FileName = "bootstrap_test_frag" + std::to_string(x) + ".FCIDUMP";
		Eigen::MatrixXd H;
		Eigen::Tensor<double, 4> ERI;
		double ECore;
		int NumOrbitals, NumElectrons;
		ReadFCIDUMP(FileName, H, ERI, ECore, NumOrbitals, NumElectrons);
		REQUIRE(NumOrbitals == BE.Bases[x].NumOrbitals());
		REQUIRE(NumElectrons == BE.Bases[x].NumElectrons);
		REQUIRE((H - BE.BareHamiltonians[x].OneBody()).norm() < 1E-12);
		REQUIRE(ECore == Approx(BE.BareHamiltonians[x].ECore));
		std::remove(FileName.c_str());
	}

	// In the fragment MO basis the one particle operator of the embedded HF problem is unchanged in trace.
	BE.ExportFCIDUMP("bootstrap_test_mo_", true);
	for (int x = 0; x < BE.NumFrag; x++)
	{
		std::string FileName = "bootstrap_test_mo_frag" + std::to_string(x) + ".FCIDUMP";
		Eigen::MatrixXd H;
		Eigen::Tensor<double, 4> ERI;
		double ECore;
		int NumOrbitals, NumElectrons;
		ReadFCIDUMP(FileName, H, ERI, ECore, NumOrbitals, NumElectrons);
		REQUIRE(H.trace() == Approx(BE.BareHamiltonians[x].OneBody().trace()).margin(1E-10));
		std::remove(FileName.c_str());
	}
}
