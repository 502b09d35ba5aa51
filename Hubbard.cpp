#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Functions.h"

// Hubbard model on the bonds of a graph: hopping -t between bonded sites and on-site repulsion U.
void HubbardIntegrals(const Eigen::MatrixXi &AdjacencyMatrix, double t, double U, Eigen::MatrixXd &HCore, Eigen::Tensor<double, 4> &ERI)
{
    int N = AdjacencyMatrix.rows();
    HCore = Eigen::MatrixXd::Zero(N, N);
    for (int i = 0; i < N; i++)
    {
        for (int j = 0; j < N; j++)
        {
            if (i != j && AdjacencyMatrix(i, j) == 1) HCore(i, j) = -t;
        }
    }
    ERI = Eigen::Tensor<double, 4>(N, N, N, N);
    ERI.setZero();
    for (int i = 0; i < N; i++) ERI(i, i, i, i) = U;
}
