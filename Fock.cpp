#include <iostream>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>
#include "Functions.h"

/// <summary>
/// Calculates the electron-electron repulsion term for each matrix element of the Fock matrix,
/// using the spin summed density:
/// v_mn = sum_ij D_ij [(mn|ij) - 1/2 (mi|jn)]
/// </summary>
/// <param name="m">
/// Row of the Fock matrix.
/// </param>
/// <param name="n">
/// Column of the Fock matrix.
/// </param>
/// <param name="DensityMatrix">
/// Spin summed density matrix.
/// </param>
/// <param name="ERI">
/// Two electron integrals in chemists' notation.
/// </param>
double ExchangeTerm(int m, int n, const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI)
{
    double XTerm = 0;
    for (int i = 0; i < DensityMatrix.rows(); i++)
    {
        for (int j = 0; j < DensityMatrix.cols(); j++)
        {
            XTerm += DensityMatrix(i, j) * (ERI(m, n, i, j) - 0.5 * ERI(m, i, j, n));
        }
    }
    return XTerm;
}

/// <summary>
/// Mean field potential J[D] - K[D] / 2 of a spin summed density.
/// </summary>
Eigen::MatrixXd CoulombExchange(const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI)
{
    int N = DensityMatrix.rows();
    Eigen::MatrixXd V(N, N);
    for (int m = 0; m < N; m++)
    {
        for (int n = m; n < N; n++)
        {
            V(m, n) = ExchangeTerm(m, n, DensityMatrix, ERI);
            V(n, m) = V(m, n);
        }
    }
    return V;
}

/// <summary>
/// Takes a density matrix and calculates the corresponding Fock matrix.
/// </summary>
/// <param name="FockMatrix">
/// Container for Fock matrix.
/// </param>
/// <param name="HCore">
/// One electron part of the Hamiltonian.
/// </param>
/// <param name="DensityMatrix">
/// Spin summed density matrix of the current iteration.
/// </param>
/// <param name="ERI">
/// Two electron integrals.
/// </param>
void BuildFockMatrix(Eigen::MatrixXd &FockMatrix, const Eigen::MatrixXd &HCore, const Eigen::MatrixXd &DensityMatrix, const Eigen::Tensor<double, 4> &ERI)
{
    FockMatrix = HCore + CoulombExchange(DensityMatrix, ERI);
}

// Two particle density of a single determinant: G_pqrs = D_pq D_rs - 1/2 D_ps D_rq.
Eigen::Tensor<double, 4> MeanFieldTwoRDM(const Eigen::MatrixXd &D)
{
    int N = D.rows();
    Eigen::Tensor<double, 4> Gamma(N, N, N, N);
    for (int p = 0; p < N; p++)
    {
        for (int q = 0; q < N; q++)
        {
            for (int r = 0; r < N; r++)
            {
                for (int s = 0; s < N; s++)
                {
                    Gamma(p, q, r, s) = D(p, q) * D(r, s) - 0.5 * D(p, s) * D(r, q);
                }
            }
        }
    }
    return Gamma;
}
