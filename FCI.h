#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <vector>
#include <string>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Solver.h"
#include "Embedding.h"

// a+_p a_q |I> = Sign |J>
struct Excitation
{
    int I;
    int J;
    int Sign;
};

// All strings of NumElectrons same spin electrons in NumOrbitals orbitals, in lexicographic order,
// with the single excitation lists for every p, q.
class StringSpace
{
    public:
        int NumOrbitals = 0;
        int NumElectrons = 0;
        int Dim = 0;
        std::vector< unsigned long long > Strings;
        std::vector< std::vector< Excitation > > Excitations; // Index p * NumOrbitals + q.

        void Init(int, int);
};

// Full configuration interaction for the singlet (Ms = 0) ground state of an embedded Hamiltonian.
// The CI vector is stored as a matrix, alpha strings on rows and beta strings on columns. Small
// problems are diagonalized directly, larger ones with the Davidson method.
class FCI : public ImpuritySolver
{
    public:
        int MaxIteration = 1000;
        int MaxSubspace = 40;
        int DenseDim = 100;
        double Tolerance = 1E-9; // On the norm of the Davidson residual. Converged is only set below it.

        SolverResult Solve(const EmbeddedHamiltonian&) const;
        std::string Name() const { return "FCI"; }

    private:
        Eigen::MatrixXd Sigma(const StringSpace&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&, const Eigen::MatrixXd&) const;
        Eigen::MatrixXd Diagonal(const StringSpace&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&) const;
        bool Davidson(const StringSpace&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&, const Eigen::MatrixXd&, Eigen::MatrixXd&, double&, int&) const;
        void DirectFCI(const StringSpace&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&, const Eigen::MatrixXd&, Eigen::MatrixXd&, double&) const;
        void FormRDM(const StringSpace&, const Eigen::MatrixXd&, Eigen::MatrixXd&, Eigen::Tensor<double, 4>&) const;
};
