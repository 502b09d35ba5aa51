#include <iostream>
#include <vector>
#include <map>
#include <bitset>
#include <random>
#include <cmath>
#include <string>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/CXX11/Tensor>
#include <boost/math/special_functions/binomial.hpp>
#include "FCI.h"
#include "Functions.h"
#include "BEErrors.h"

static void eigh(const Eigen::MatrixXd& A, Eigen::MatrixXd& U, Eigen::VectorXd& D)
{
	Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es;
	es.compute(A);
	D = es.eigenvalues();
	U = es.eigenvectors();
}

static double MDOT(const Eigen::MatrixXd& A, const Eigen::MatrixXd& B)
{
    return (A.cwiseProduct(B)).sum();
}

// Number of set bits of String strictly below orbital p.
static int CountBelow(unsigned long long String, int p)
{
    unsigned long long Mask = (p == 0) ? 0ULL : ((1ULL << p) - 1ULL);
    return std::bitset<64>(String & Mask).count();
}

// Projects X out of the space of Xi, twice for stability. Returns the norm left after the first
// projection; X is normalized only if that is not negligible.
static double GS(Eigen::MatrixXd& X, const std::vector< Eigen::MatrixXd > &Xi)
{
    double dum;

//  Gramm-Schmidt Once
    for (int i = 0; i < Xi.size(); i++)
    {
        dum = MDOT(X, Xi[i]);
        X -= dum * Xi[i];
    }
    double Norm = X.norm();
    if (Norm < 1E-12) return Norm;
    X /= Norm;

//  Gramm-Schmidt Twice (for Stability)
    for (int i = 0; i < Xi.size(); i++)
    {
        dum = MDOT(X, Xi[i]);
        X -= dum * Xi[i];
    }
    X.normalize();
    return Norm;
}

/* Strings are bit patterns with bit p set when orbital p is occupied. They are generated in increasing
   order by taking the next larger integer with the same number of set bits. Then for every string
   I and every pair p, q with q occupied and p empty (or p = q) we store J and the sign of
   a+_p a_q |I>, which is (-1) to the number of electrons passed over by each operator. */
void StringSpace::Init(int NumOrb, int NumElec)
{
    if (NumOrb > 63)
    {
        throw ConfigurationError("FCI is limited to 63 orbitals, got " + std::to_string(NumOrb));
    }
    if (NumElec < 0 || NumElec > NumOrb)
    {
        throw ConfigurationError("Cannot place " + std::to_string(NumElec) + " electrons of one spin in " + std::to_string(NumOrb) + " orbitals");
    }
    NumOrbitals = NumOrb;
    NumElectrons = NumElec;
    Strings.clear();

    unsigned long long Last = 1ULL << NumOrbitals;
    unsigned long long s = (NumElectrons == 0) ? 0ULL : ((1ULL << NumElectrons) - 1ULL);
    if (NumElectrons == 0) Strings.push_back(0ULL);
    else
    {
        while (s < Last)
        {
            Strings.push_back(s);
            unsigned long long c = s & (~s + 1ULL);
            unsigned long long r = s + c;
            s = (((r ^ s) >> 2) / c) | r;
        }
    }
    Dim = Strings.size();
    double Expected = boost::math::binomial_coefficient<double>(NumOrbitals, NumElectrons);
    if (Dim != (int)std::round(Expected))
    {
        throw BEError("Generated " + std::to_string(Dim) + " strings, expected " + std::to_string((int)std::round(Expected)));
    }

    std::map< unsigned long long, int > StringIndex;
    for (int I = 0; I < Dim; I++) StringIndex[Strings[I]] = I;

    Excitations.assign(NumOrbitals * NumOrbitals, std::vector< Excitation >());
    for (int I = 0; I < Dim; I++)
    {
        unsigned long long String = Strings[I];
        for (int q = 0; q < NumOrbitals; q++)
        {
            if (!(String & (1ULL << q))) continue;
            unsigned long long Annihilated = String ^ (1ULL << q);
            int SignQ = (CountBelow(String, q) % 2 == 0) ? 1 : -1;
            for (int p = 0; p < NumOrbitals; p++)
            {
                if (Annihilated & (1ULL << p)) continue;
                unsigned long long Created = Annihilated | (1ULL << p);
                int SignP = (CountBelow(Annihilated, p) % 2 == 0) ? 1 : -1;
                Excitation Ex;
                Ex.I = I;
                Ex.J = StringIndex[Created];
                Ex.Sign = SignQ * SignP;
                Excitations[p * NumOrbitals + q].push_back(Ex);
            }
        }
    }
}

// E_pq C = (Ea_pq + Eb_pq) C. Alpha strings run over the rows, beta strings over the columns.
static Eigen::MatrixXd ApplyExcitation(const StringSpace &Space, int pq, const Eigen::MatrixXd &C)
{
    Eigen::MatrixXd EC = Eigen::MatrixXd::Zero(C.rows(), C.cols());
    const std::vector< Excitation > &Ex = Space.Excitations[pq];
    for (int e = 0; e < Ex.size(); e++)
    {
        EC.row(Ex[e].J) += Ex[e].Sign * C.row(Ex[e].I);
        EC.col(Ex[e].J) += Ex[e].Sign * C.col(Ex[e].I);
    }
    return EC;
}

/* H = sum_pq h_pq E_pq + 1/2 sum_pqrs (pq|rs) (E_pq E_rs - delta_qr E_ps)
     = sum_pq k_pq E_pq + 1/2 sum_pqrs (pq|rs) E_pq E_rs,  with k_pq = h_pq - 1/2 sum_r (pr|rq).
   The sigma vector is built from the intermediates T_rs = E_rs C and W_pq = sum_rs (pq|rs) T_rs. */
Eigen::MatrixXd FCI::Sigma(const StringSpace &Space, const Eigen::MatrixXd &h, const Eigen::Tensor<double, 4> &V, const Eigen::MatrixXd &C) const
{
    int n = Space.NumOrbitals;
    Eigen::MatrixXd k = h;
    for (int p = 0; p < n; p++)
    {
        for (int q = 0; q < n; q++)
        {
            for (int r = 0; r < n; r++)
            {
                k(p, q) -= 0.5 * V(p, r, r, q);
            }
        }
    }

    std::vector< Eigen::MatrixXd > T(n * n);
    for (int rs = 0; rs < n * n; rs++) T[rs] = ApplyExcitation(Space, rs, C);

    Eigen::MatrixXd HC = Eigen::MatrixXd::Zero(C.rows(), C.cols());
    for (int p = 0; p < n; p++)
    {
        for (int q = 0; q < n; q++)
        {
            HC += k(p, q) * T[p * n + q];
            Eigen::MatrixXd W = Eigen::MatrixXd::Zero(C.rows(), C.cols());
            for (int r = 0; r < n; r++)
            {
                for (int s = 0; s < n; s++)
                {
                    if (fabs(V(p, q, r, s)) < 1E-14) continue;
                    W += V(p, q, r, s) * T[r * n + s];
                }
            }
            HC += 0.5 * ApplyExcitation(Space, p * n + q, W);
        }
    }
    return HC;
}

// Energies of the single determinants, the preconditioner of the Davidson iterations.
Eigen::MatrixXd FCI::Diagonal(const StringSpace &Space, const Eigen::MatrixXd &h, const Eigen::Tensor<double, 4> &V) const
{
    int n = Space.NumOrbitals;
    std::vector< std::vector< int > > Occupied(Space.Dim);
    for (int I = 0; I < Space.Dim; I++)
    {
        for (int p = 0; p < n; p++)
        {
            if (Space.Strings[I] & (1ULL << p)) Occupied[I].push_back(p);
        }
    }

    // One spin part: sum_i h_ii + 1/2 sum_ij [(ii|jj) - (ij|ji)]
    Eigen::VectorXd SameSpin(Space.Dim);
    for (int I = 0; I < Space.Dim; I++)
    {
        double E = 0;
        for (int a = 0; a < Occupied[I].size(); a++)
        {
            int i = Occupied[I][a];
            E += h(i, i);
            for (int b = 0; b < Occupied[I].size(); b++)
            {
                int j = Occupied[I][b];
                E += 0.5 * (V(i, i, j, j) - V(i, j, j, i));
            }
        }
        SameSpin[I] = E;
    }

    Eigen::MatrixXd Hd(Space.Dim, Space.Dim);
    for (int Ia = 0; Ia < Space.Dim; Ia++)
    {
        for (int Ib = 0; Ib < Space.Dim; Ib++)
        {
            double E = SameSpin[Ia] + SameSpin[Ib];
            for (int a = 0; a < Occupied[Ia].size(); a++)
            {
                for (int b = 0; b < Occupied[Ib].size(); b++)
                {
                    E += V(Occupied[Ia][a], Occupied[Ia][a], Occupied[Ib][b], Occupied[Ib][b]);
                }
            }
            Hd(Ia, Ib) = E;
        }
    }
    return Hd;
}

// Builds the full Hamiltonian column by column and keeps the lowest state that is symmetric
// under exchange of alpha and beta strings (even S).
void FCI::DirectFCI(const StringSpace &Space, const Eigen::MatrixXd &h, const Eigen::Tensor<double, 4> &V, const Eigen::MatrixXd &Hd,
                    Eigen::MatrixXd &X, double &Energy) const
{
    int Dim = Space.Dim;
    Eigen::MatrixXd H(Dim * Dim, Dim * Dim);
    Eigen::MatrixXd Unit = Eigen::MatrixXd::Zero(Dim, Dim);
    for (int Col = 0; Col < Dim * Dim; Col++)
    {
        Unit.setZero();
        Unit(Col % Dim, Col / Dim) = 1;
        Eigen::MatrixXd HUnit = Sigma(Space, h, V, Unit);
        H.col(Col) = Eigen::Map<Eigen::VectorXd>(HUnit.data(), Dim * Dim);
    }
    H = 0.5 * (H + H.transpose());

    Eigen::MatrixXd U;
    Eigen::VectorXd E;
    eigh(H, U, E);
    for (int i = 0; i < Dim * Dim; i++)
    {
        Eigen::MatrixXd Xi = Eigen::Map<Eigen::MatrixXd>(U.col(i).data(), Dim, Dim);
        Eigen::MatrixXd X1 = Xi - Xi.transpose();
        if (X1.squaredNorm() / Xi.squaredNorm() < 1E-2)
        {
            X = Xi;
            Energy = E[i];
            return;
        }
    }
    X = Eigen::Map<Eigen::MatrixXd>(U.col(0).data(), Dim, Dim);
    Energy = E[0];
}

/* Davidson iterations for the lowest state. The guess is the lowest determinant plus a small random
   admixture, symmetrized between alpha and beta so that the search stays among even S states. New
   directions are the residual divided by (E - Hd). When the subspace reaches MaxSubspace it collapses
   to the current best vector. */
bool FCI::Davidson(const StringSpace &Space, const Eigen::MatrixXd &h, const Eigen::Tensor<double, 4> &V, const Eigen::MatrixXd &Hd,
                   Eigen::MatrixXd &X, double &Energy, int &Iterations) const
{
    int Dim = Space.Dim;
    int Ia0, Ib0;
    Hd.minCoeff(&Ia0, &Ib0);

    std::mt19937 Generator(12345);
    std::uniform_real_distribution<double> Distribution(-1.0, 1.0);
    X = Eigen::MatrixXd::Zero(Dim, Dim);
    for (int i = 0; i < Dim; i++)
    {
        for (int j = 0; j < Dim; j++)
        {
            X(i, j) = 1E-3 * Distribution(Generator);
        }
    }
    X(Ia0, Ib0) += 1;
    X(Ib0, Ia0) += 1;
    X = 0.5 * (X + X.transpose());
    X.normalize();

    std::vector< Eigen::MatrixXd > Xi, XiH;
    Xi.push_back(X);
    XiH.push_back(Sigma(Space, h, V, X));

    Eigen::MatrixXd XH;
    for (Iterations = 1; Iterations <= MaxIteration; Iterations++)
    {
        int k = Xi.size();
        Eigen::MatrixXd Hm(k, k);
        for (int a = 0; a < k; a++)
        {
            for (int b = 0; b <= a; b++)
            {
                Hm(a, b) = Hm(b, a) = MDOT(Xi[a], XiH[b]);
            }
        }
        Eigen::MatrixXd U;
        Eigen::VectorXd Eig;
        eigh(Hm, U, Eig);
        Energy = Eig[0];

        X = Eigen::MatrixXd::Zero(Dim, Dim);
        XH = Eigen::MatrixXd::Zero(Dim, Dim);
        for (int a = 0; a < k; a++)
        {
            X += U(a, 0) * Xi[a];
            XH += U(a, 0) * XiH[a];
        }

        Eigen::MatrixXd R = XH - Energy * X;
        if (R.norm() < Tolerance) return true;

        Eigen::MatrixXd X1(Dim, Dim);
        for (int i = 0; i < Dim; i++)
        {
            for (int j = 0; j < Dim; j++)
            {
                double Denominator = Energy - Hd(i, j);
                if (fabs(Denominator) < 1E-8) Denominator = (Denominator < 0) ? -1E-8 : 1E-8;
                X1(i, j) = R(i, j) / Denominator;
            }
        }
        X1 = 0.5 * (X1 + X1.transpose());

        if (k >= MaxSubspace)
        {
            double Norm = X.norm();
            Xi.clear();
            XiH.clear();
            Xi.push_back(X / Norm);
            XiH.push_back(XH / Norm);
        }

        if (GS(X1, Xi) < 1E-12)
        {
            // Nothing new to add, and the residual is still above Tolerance.
            return false;
        }
        Xi.push_back(X1);
        XiH.push_back(Sigma(Space, h, V, X1));
    }
    return false;
}

/* OneRDM_pq = <C|E_pq|C> and TwoRDM_pqrs = <C|E_pq E_rs|C> - delta_qr OneRDM_ps. Since E_pq is the
   adjoint of E_qp, <C|E_pq E_rs|C> is the overlap of E_qp C with E_rs C. */
void FCI::FormRDM(const StringSpace &Space, const Eigen::MatrixXd &C, Eigen::MatrixXd &OneRDM, Eigen::Tensor<double, 4> &TwoRDM) const
{
    int n = Space.NumOrbitals;
    std::vector< Eigen::MatrixXd > T(n * n);
    for (int pq = 0; pq < n * n; pq++) T[pq] = ApplyExcitation(Space, pq, C);

    OneRDM = Eigen::MatrixXd::Zero(n, n);
    for (int p = 0; p < n; p++)
    {
        for (int q = 0; q < n; q++)
        {
            OneRDM(p, q) = MDOT(C, T[p * n + q]);
        }
    }
    OneRDM = 0.5 * (OneRDM + OneRDM.transpose());

    TwoRDM = Eigen::Tensor<double, 4>(n, n, n, n);
    for (int p = 0; p < n; p++)
    {
        for (int q = 0; q < n; q++)
        {
            for (int r = 0; r < n; r++)
            {
                for (int s = 0; s < n; s++)
                {
                    TwoRDM(p, q, r, s) = MDOT(T[q * n + p], T[r * n + s]);
                    if (q == r) TwoRDM(p, q, r, s) -= OneRDM(p, s);
                }
            }
        }
    }
}

SolverResult FCI::Solve(const EmbeddedHamiltonian &Ham) const
{
    SolverResult Result;
    if (Ham.NumElectrons % 2 != 0)
    {
        throw ConfigurationError("FCI needs an even number of electrons, fragment " + std::to_string(Ham.FragmentId) + " has " + std::to_string(Ham.NumElectrons));
    }
    StringSpace Space;
    Space.Init(Ham.NumOrbitals, Ham.NumElectrons / 2);

    Eigen::MatrixXd h = Ham.OneBody();
    Eigen::MatrixXd Hd = Diagonal(Space, h, Ham.TwoBody);
    Eigen::MatrixXd X;
    double Energy = 0;
    if (Space.Dim * Space.Dim <= DenseDim)
    {
        DirectFCI(Space, h, Ham.TwoBody, Hd, X, Energy);
        Result.Converged = true;
        Result.Iterations = 1;
    }
    else
    {
        Result.Converged = Davidson(Space, h, Ham.TwoBody, Hd, X, Energy, Result.Iterations);
    }
    X.normalize();

    FormRDM(Space, X, Result.OneRDM, Result.TwoRDM);
    Result.Energy = Energy + Ham.ECore;
    Result.CorrelationEnergy = Result.Energy - EmbeddedEnergy(Ham, Ham.ReferenceDensity, MeanFieldTwoRDM(Ham.ReferenceDensity));
    return Result;
}
