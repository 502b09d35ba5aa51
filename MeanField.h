#pragma once
#include <iostream>
#include <fstream>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

class InputObj;

// Restricted mean field reference of the whole system, in the atomic orbital basis.
class MeanField
{
public:
	int NumAO = 0;
	int NumElectrons = 0;
	int NumOcc = 0;
	double ENuc = 0;
	double EHF = 0; // Total energy including ENuc.
	bool Converged = false;
	int SCFCount = 0;

	Eigen::MatrixXd OverlapMatrix;
	Eigen::MatrixXd HCore;
	Eigen::Tensor<double, 4> ERI;

	Eigen::MatrixXd DensityMatrix; // Spin summed, trace(DS) = NumElectrons.
	Eigen::MatrixXd FockMatrix;
	Eigen::MatrixXd CoeffMatrix;
	Eigen::VectorXd OrbitalEV;
	std::vector< double > Occupations;

	void InitFromInput(const InputObj&);
	void SetIntegrals(const Eigen::MatrixXd&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&, double, int);
	void RunRHF(std::ofstream&, int MaxSCF = 5000, double SCFTol = 1E-8);
};
