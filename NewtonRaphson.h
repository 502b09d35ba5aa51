#pragma once
#include <iostream>
#include <functional>
#include <Eigen/Dense>
#include <Eigen/SVD>
#include <vector>

// Quasi-Newton step for f(x) = 0 where f may have more entries than x. The step solves
// J dx = -f in the least squares sense and is optionally kept inside a trust region.
class NewtonRaphson
{
public:
    Eigen::VectorXd x; // Input
    Eigen::MatrixXd J; // Jacobian at x
    Eigen::VectorXd f; // Function at x
    Eigen::VectorXd dx; // Last step

    bool UseTrustRegion = true;
    double TrustRadius = 0.5;
    double MaxTrustRadius = 2.0;
    double SVDCutoff = 1E-8; // Relative to the largest singular value.

    double PredictedReduction = 0; // |f|^2 - |f + J dx|^2
    bool StepCapped = false;

    bool doNewton();
    void BroydenUpdate(const Eigen::VectorXd&);
    double UpdateTrustRadius(const Eigen::VectorXd&);
};

double SolveChemicalPotential(const std::function< double(double) >&, double, double, double, double, int&);
