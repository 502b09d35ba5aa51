#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Fragmenting.h"
#include "Embedding.h"

enum class EnergyExpression { NonCumulant, Cumulant };
EnergyExpression ParseEnergyExpression(const std::string&);
std::string ExpressionName(EnergyExpression);

// Weighted contributions of the center rows of one fragment.
struct FragmentEnergy
{
    int FragmentId = -1;
    double E1 = 0;
    double EC = 0;
    double E2 = 0;
    double TrFdg = 0;
    double TrVK = 0;

    double NonCumulant() const { return E1 + EC + E2; }
    double Cumulant() const { return TrFdg + TrVK; }
};

struct BEEnergy
{
    EnergyExpression Expression = EnergyExpression::NonCumulant;
    double Total = 0;
    double Correlation = 0;
    double EHF = 0;
    double ENuc = 0;
    double E1 = 0;
    double EC = 0;
    double E2 = 0;
    double TrFdg = 0;
    double TrVK = 0;
    std::vector< FragmentEnergy > Fragments;
};

FragmentEnergy FragmentEnergyTerms(const Fragment&, const EmbeddedHamiltonian&, const Eigen::MatrixXd&, const Eigen::Tensor<double, 4>&);
BEEnergy AssembleEnergy(const std::vector< Fragment >&, const std::vector< EmbeddedHamiltonian >&, const std::vector< Eigen::MatrixXd >&,
                        const std::vector< Eigen::Tensor<double, 4> >&, double, double, EnergyExpression);
void PrintEnergy(const BEEnergy&, std::ostream&);
