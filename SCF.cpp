#include <iostream>
#include <cmath>
#include <vector>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <string>
#include <fstream>
#include <Eigen/Eigenvalues>
#include <ctime>
#include <iomanip>
#include "MeanField.h"
#include "ReadInput.h"
#include "Functions.h"
#include "BEErrors.h"

/// <summary>
/// Sum of element wise product of two matrices.
/// </summary>
double MatrixDot(const Eigen::MatrixXd &FirstMatrix, const Eigen::MatrixXd &SecondMatrix)
{
    return FirstMatrix.cwiseProduct(SecondMatrix).sum();
}

/// <summary>
/// Forms the DIIS Fock matrix and puts it into FockMatrix.
/// </summary>
/// <param name="FockMatrix">
/// Will hold F', the modified Fock matrix.
/// </param>
/// <param name="AllFockMatrices">
/// Vector of all previous Fock matrices to be used in the sum that gives F'
/// </param>
/// <param name="AllErrorMatrices">
/// Vector of error matrices, to be used to form the linear system.
/// </param>
void DIIS(Eigen::MatrixXd &FockMatrix, std::vector< Eigen::MatrixXd > &AllFockMatrices, std::vector< Eigen::MatrixXd > &AllErrorMatrices)
{
    int NumDIIS = AllErrorMatrices.size();
    Eigen::MatrixXd B(NumDIIS + 1, NumDIIS + 1); // This is the linear system we solve for the coefficients.
    for (int i = 0; i < NumDIIS; i++)
    {
        for (int j = i; j < NumDIIS; j++)
        {
            B(i, j) = MatrixDot(AllErrorMatrices[i], AllErrorMatrices[j]);
            B(j, i) = B(i, j);
        }
    }
    for (int i = 0; i < NumDIIS; i++)
    {
        B(i, NumDIIS) = -1;
        B(NumDIIS, i) = -1;
    }
    B(NumDIIS, NumDIIS) = 0;

    Eigen::VectorXd b = Eigen::VectorXd::Zero(NumDIIS + 1);
    b(NumDIIS) = -1;
    // We want to solve for c in Bc = b
    Eigen::VectorXd c = B.colPivHouseholderQr().solve(b);

    /* And now put it together to get the new FockMatrix. If we are on the first iteration, then c1 = 1 and we end up where we
       started. */
    FockMatrix = Eigen::MatrixXd::Zero(FockMatrix.rows(), FockMatrix.cols());
    for (int i = 0; i < NumDIIS; i++)
    {
        FockMatrix += c[i] * AllFockMatrices[i];
    }
}

/* Aufbau: the NumOcc lowest orbitals of the Fock matrix are doubly occupied. */
void DiagonalizeFock(const Eigen::MatrixXd &FockMatrix, const Eigen::MatrixXd &SOrtho, Eigen::MatrixXd &CoeffMatrix, Eigen::VectorXd &OrbitalEV)
{
    Eigen::MatrixXd FockOrtho = SOrtho.transpose() * FockMatrix * SOrtho; // Fock matrix in orthonormal basis.
    Eigen::SelfAdjointEigenSolver< Eigen::MatrixXd > EigensystemFockOrtho(FockOrtho); // Eigenvectors and eigenvalues ordered from lowest to highest eigenvalues
    CoeffMatrix = SOrtho * EigensystemFockOrtho.eigenvectors(); // Multiply the matrix of coefficients by S^-1/2 to get coefficients for nonorthonormal basis.
    OrbitalEV = EigensystemFockOrtho.eigenvalues();
}

/// <summary>
/// Runs restricted Hartree-Fock with DIIS until the commutator FDS - SDF vanishes. The density
/// on entry is used as the starting guess when it has the right size and is not zero, otherwise
/// the core Hamiltonian is diagonalized. Nothing is printed, so this is also used inside the
/// fragments. Returns whether the iterations converged.
/// </summary>
/// <param name="Energy">
/// Electronic energy, 1/2 sum_ij D_ij (H_ij + F_ij), of the final density.
/// </param>
/// <param name="SCFCount">
/// Number of Fock builds performed.
/// </param>
bool SCF(const Eigen::MatrixXd &HCore, const Eigen::MatrixXd &OverlapMatrix, const Eigen::Tensor<double, 4> &ERI, int NumOcc, Eigen::MatrixXd &DensityMatrix, Eigen::MatrixXd &FockMatrix,
         Eigen::MatrixXd &CoeffMatrix, Eigen::VectorXd &OrbitalEV, double &Energy, int MaxSCF, double SCFTol, int &SCFCount)
{
    int N = HCore.rows();
    Eigen::MatrixXd SHalf, SOrtho;
    LowdinOrthogonalization(OverlapMatrix, SHalf, SOrtho);

    if (DensityMatrix.rows() != N || DensityMatrix.cols() != N || DensityMatrix.isZero())
    {
        DiagonalizeFock(HCore, SOrtho, CoeffMatrix, OrbitalEV);
        DensityMatrix = 2.0 * CoeffMatrix.leftCols(NumOcc) * CoeffMatrix.leftCols(NumOcc).transpose();
    }

    std::vector< Eigen::MatrixXd > AllFockMatrices; // Holds previous fock matrices for DIIS procedure.
    std::vector< Eigen::MatrixXd > AllErrorMatrices; // Error matrices for DIIS
    int MaxDIIS = 8;
    SCFCount = 0;
    while (SCFCount < MaxSCF)
    {
        SCFCount++;
        BuildFockMatrix(FockMatrix, HCore, DensityMatrix, ERI);
        Energy = 0.5 * (DensityMatrix.cwiseProduct(HCore + FockMatrix)).sum();

        Eigen::MatrixXd ErrorMatrix = FockMatrix * DensityMatrix * OverlapMatrix - OverlapMatrix * DensityMatrix * FockMatrix; // DIIS error matrix of the current iteration: FDS - SDF
        double DIISError = (ErrorMatrix.size() == 0) ? 0 : ErrorMatrix.cwiseAbs().maxCoeff();
        if (DIISError < SCFTol)
        {
            DiagonalizeFock(FockMatrix, SOrtho, CoeffMatrix, OrbitalEV);
            return true;
        }

        AllFockMatrices.push_back(FockMatrix);
        AllErrorMatrices.push_back(ErrorMatrix);
        if (AllFockMatrices.size() > MaxDIIS)
        {
            AllFockMatrices.erase(AllFockMatrices.begin());
            AllErrorMatrices.erase(AllErrorMatrices.begin());
        }
        Eigen::MatrixXd FockDIIS = FockMatrix;
        DIIS(FockDIIS, AllFockMatrices, AllErrorMatrices); // Generates F' using DIIS.

        DiagonalizeFock(FockDIIS, SOrtho, CoeffMatrix, OrbitalEV);
        DensityMatrix = 2.0 * CoeffMatrix.leftCols(NumOcc) * CoeffMatrix.leftCols(NumOcc).transpose();
    }
    BuildFockMatrix(FockMatrix, HCore, DensityMatrix, ERI);
    Energy = 0.5 * (DensityMatrix.cwiseProduct(HCore + FockMatrix)).sum();
    DiagonalizeFock(FockMatrix, SOrtho, CoeffMatrix, OrbitalEV);
    return false;
}

void MeanField::SetIntegrals(const Eigen::MatrixXd &S, const Eigen::MatrixXd &H, const Eigen::Tensor<double, 4> &TEI, double NuclearRepulsion, int Electrons)
{
    if (Electrons % 2 != 0)
    {
        throw ConfigurationError("A restricted reference needs an even number of electrons, got " + std::to_string(Electrons));
    }
    NumAO = H.rows();
    NumElectrons = Electrons;
    NumOcc = Electrons / 2;
    if (NumOcc > NumAO)
    {
        throw ConfigurationError("More occupied orbitals than basis functions");
    }
    OverlapMatrix = S;
    HCore = H;
    ERI = TEI;
    ENuc = NuclearRepulsion;
    DensityMatrix = Eigen::MatrixXd::Zero(NumAO, NumAO);
    Converged = false;
}

void MeanField::InitFromInput(const InputObj &Input)
{
    SetIntegrals(Input.OverlapMatrix, Input.HCore, Input.ERI, Input.ENuc, Input.NumElectrons);
}

void MeanField::RunRHF(std::ofstream &Output, int MaxSCF, double SCFTol)
{
    std::cout << std::fixed << std::setprecision(10);
    std::cout << "SCF: Running restricted Hartree-Fock for " << NumElectrons << " electrons in " << NumAO << " orbitals." << std::endl;
    Output << "SCF: Running restricted Hartree-Fock for " << NumElectrons << " electrons in " << NumAO << " orbitals." << std::endl;
    clock_t ClockStart = clock();

    double Energy = 0;
    Converged = SCF(HCore, OverlapMatrix, ERI, NumOcc, DensityMatrix, FockMatrix, CoeffMatrix, OrbitalEV, Energy, MaxSCF, SCFTol, SCFCount);
    EHF = Energy + ENuc;

    Occupations.assign(NumAO, 0.0);
    for (int i = 0; i < NumOcc; i++) Occupations[i] = 2.0;

    if (!Converged)
    {
        std::cout << "SCF: Warning: no convergence after " << SCFCount << " iterations." << std::endl;
        Output << "SCF: Warning: no convergence after " << SCFCount << " iterations." << std::endl;
    }
    std::cout << "SCF: E_HF = " << EHF << " after " << SCFCount << " iterations (" << (double)(clock() - ClockStart) / CLOCKS_PER_SEC << " s)" << std::endl;
    Output << "SCF: E_HF = " << std::fixed << std::setprecision(10) << EHF << " after " << SCFCount << " iterations" << std::endl;
    Output << "SCF: Orbital energies\n" << OrbitalEV.transpose() << std::endl;
}
