#include <iostream>
#include <Eigen/Dense>
#include <Eigen/SVD>
#include <vector>
#include <cmath>
#include <functional>
#include <limits>
#include <utility>

#include <boost/math/tools/roots.hpp>
#include <boost/cstdint.hpp>

#include "NewtonRaphson.h"

/* Computes dx from the pseudoinverse of J. Singular values below SVDCutoff times the largest one
   are dropped. Returns false if none is left, in which case no step is possible. */
bool NewtonRaphson::doNewton()
{
    Eigen::JacobiSVD< Eigen::MatrixXd > SVD(J, Eigen::ComputeThinU | Eigen::ComputeThinV);
    Eigen::VectorXd Sigma = SVD.singularValues();
    if (Sigma.size() == 0 || Sigma[0] <= std::numeric_limits<double>::min()) return false;

    Eigen::VectorXd UTf = SVD.matrixU().transpose() * f;
    Eigen::VectorXd Coeff = Eigen::VectorXd::Zero(Sigma.size());
    int NumKept = 0;
    for (int i = 0; i < Sigma.size(); i++)
    {
        if (Sigma[i] < SVDCutoff * Sigma[0]) continue;
        Coeff[i] = -UTf[i] / Sigma[i];
        NumKept++;
    }
    if (NumKept == 0) return false;
    dx = SVD.matrixV() * Coeff;

    StepCapped = false;
    if (UseTrustRegion && dx.norm() > TrustRadius)
    {
        dx *= TrustRadius / dx.norm();
        StepCapped = true;
    }
    PredictedReduction = f.squaredNorm() - (f + J * dx).squaredNorm();
    return true;
}

// J <- J + (df - J dx) dx^T / (dx^T dx), with df the change in f over the last step.
void NewtonRaphson::BroydenUpdate(const Eigen::VectorXd &fNew)
{
    double dxdx = dx.squaredNorm();
    if (dxdx < 1E-30) return;
    Eigen::VectorXd df = fNew - f;
    J += ((df - J * dx) * dx.transpose()) / dxdx;
}

/* Ratio of the actual to the predicted decrease of |f|^2 for the last step. The radius shrinks
   when the model was poor and grows when it was good and the step was limited by the radius. */
double NewtonRaphson::UpdateTrustRadius(const Eigen::VectorXd &fNew)
{
    double ActualReduction = f.squaredNorm() - fNew.squaredNorm();
    double Rho;
    if (PredictedReduction <= 1E-300) Rho = (ActualReduction > 0) ? 1.0 : -1.0;
    else Rho = ActualReduction / PredictedReduction;

    if (Rho < 0.25) TrustRadius *= 0.25;
    else if (Rho > 0.75 && StepCapped) TrustRadius = std::min(2.0 * TrustRadius, MaxTrustRadius);
    return Rho;
}

// Functor returning the particle number residual and its finite difference derivative. A residual
// already below the tolerance is reported as an exact root so that the iteration stops there.
struct NumberResidualFunctor
{
    const std::function< double(double) > *Residual;
    double dMu;
    double Tolerance;

    std::pair<double, double> operator()(double const& Mu)
    {
        double f = (*Residual)(Mu);
        if (fabs(f) < Tolerance) return std::make_pair(0.0, 1.0);
        double fPlus = (*Residual)(Mu + dMu);
        return std::make_pair(f, (fPlus - f) / dMu);
    }
};

/// <summary>
/// Newton-Raphson search for the chemical potential that zeroes the particle number residual,
/// bounded to [-MuBound, MuBound]. On return MaxIteration holds the number of iterations used.
/// </summary>
double SolveChemicalPotential(const std::function< double(double) > &Residual, double Guess, double MuBound, double dMu, double Tolerance, int &MaxIteration)
{
    using namespace boost::math::tools;
    NumberResidualFunctor Functor;
    Functor.Residual = &Residual;
    Functor.dMu = dMu;
    Functor.Tolerance = Tolerance;

    const int digits = std::numeric_limits<double>::digits;
    int get_digits = static_cast<int>(digits * 0.6);
    boost::uintmax_t it = MaxIteration;
    double Mu = newton_raphson_iterate(Functor, Guess, -MuBound, MuBound, get_digits, it);
    MaxIteration = it;
    return Mu;
}
