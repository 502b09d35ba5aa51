#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "BEEnergy.h"
#include "BEErrors.h"

EnergyExpression ParseEnergyExpression(const std::string &Name)
{
    if (Name == "noncumulant" || Name == "non-cumulant") return EnergyExpression::NonCumulant;
    if (Name == "cumulant") return EnergyExpression::Cumulant;
    throw ConfigurationError("Energy expression = " + Name + " not implemented!");
}

std::string ExpressionName(EnergyExpression Expression)
{
    if (Expression == EnergyExpression::Cumulant) return "cumulant";
    return "noncumulant";
}

/* Energy terms of the center rows c of a fragment, each multiplied by the weight of c.
     E1    = sum_j D_cj h_cj
     EC    = 1/2 sum_j D_cj vcore_cj
     E2    = 1/2 sum_jkl (cj|kl) G_cjkl
     TrFdg = sum_j F_cj dg_cj,  dg = D - D_HF
     TrVK  = 1/2 sum_jkl (cj|kl) K_cjkl
   where K is the two particle density with its mean field part and the part linear in dg removed,
     K = G - Gmf(D_HF) - [dg_cj D_kl + D_cj dg_kl - 1/2 (dg_cl D_kj + D_cl dg_kj)]  (D = D_HF),
   and Gmf(D)_cjkl = D_cj D_kl - 1/2 D_cl D_kj. */
FragmentEnergy FragmentEnergyTerms(const Fragment &Frag, const EmbeddedHamiltonian &Ham, const Eigen::MatrixXd &OneRDM, const Eigen::Tensor<double, 4> &TwoRDM)
{
    FragmentEnergy Terms;
    Terms.FragmentId = Frag.Id;
    int n = Ham.NumOrbitals;
    const Eigen::MatrixXd &D0 = Ham.ReferenceDensity;
    Eigen::MatrixXd dg = OneRDM - D0;

    for (int a = 0; a < Frag.Sites.size(); a++)
    {
        double w = Frag.Weights[a];
        if (w == 0) continue;
        int c = a; // Fragment orbitals come first in the embedding basis, in site order.

        double E1 = 0, EC = 0, E2 = 0, TrFdg = 0, TrVK = 0;
        for (int j = 0; j < n; j++)
        {
            E1 += OneRDM(c, j) * Ham.HCore(c, j);
            EC += 0.5 * OneRDM(c, j) * Ham.CorePotential(c, j);
            TrFdg += Ham.Fock(c, j) * dg(c, j);
            for (int k = 0; k < n; k++)
            {
                for (int l = 0; l < n; l++)
                {
                    double V = Ham.TwoBody(c, j, k, l);
                    if (V == 0) continue;
                    E2 += 0.5 * V * TwoRDM(c, j, k, l);
                    double K = TwoRDM(c, j, k, l) - (D0(c, j) * D0(k, l) - 0.5 * D0(c, l) * D0(k, j))
                             - (dg(c, j) * D0(k, l) + D0(c, j) * dg(k, l) - 0.5 * (dg(c, l) * D0(k, j) + D0(c, l) * dg(k, j)));
                    TrVK += 0.5 * V * K;
                }
            }
        }
        Terms.E1 += w * E1;
        Terms.EC += w * EC;
        Terms.E2 += w * E2;
        Terms.TrFdg += w * TrFdg;
        Terms.TrVK += w * TrVK;
    }
    return Terms;
}

/// <summary>
/// Combines the fragment densities into the total energy. The noncumulant expression sums the weighted
/// center row energies and adds the nuclear repulsion. The cumulant expression adds the weighted
/// correlation corrections to the Hartree-Fock energy of the whole system.
/// </summary>
BEEnergy AssembleEnergy(const std::vector< Fragment > &Frags, const std::vector< EmbeddedHamiltonian > &Hamiltonians, const std::vector< Eigen::MatrixXd > &OneRDMs,
                        const std::vector< Eigen::Tensor<double, 4> > &TwoRDMs, double EHF, double ENuc, EnergyExpression Expression)
{
    BEEnergy Energy;
    Energy.Expression = Expression;
    Energy.EHF = EHF;
    Energy.ENuc = ENuc;
    for (int x = 0; x < Frags.size(); x++)
    {
        FragmentEnergy Terms = FragmentEnergyTerms(Frags[x], Hamiltonians[x], OneRDMs[x], TwoRDMs[x]);
        Energy.E1 += Terms.E1;
        Energy.EC += Terms.EC;
        Energy.E2 += Terms.E2;
        Energy.TrFdg += Terms.TrFdg;
        Energy.TrVK += Terms.TrVK;
        Energy.Fragments.push_back(Terms);
    }

    if (Expression == EnergyExpression::NonCumulant)
    {
        Energy.Total = Energy.E1 + Energy.EC + Energy.E2 + ENuc;
        Energy.Correlation = Energy.Total - EHF;
    }
    else
    {
        Energy.Correlation = Energy.TrFdg + Energy.TrVK;
        Energy.Total = EHF + Energy.Correlation;
    }
    return Energy;
}

void PrintEnergy(const BEEnergy &Energy, std::ostream &Out)
{
    Out << std::fixed << std::setprecision(8);
    Out << "BE-DMET: Energy by fragment (" << ExpressionName(Energy.Expression) << ")" << std::endl;
    for (int x = 0; x < Energy.Fragments.size(); x++)
    {
        const FragmentEnergy &Terms = Energy.Fragments[x];
        double Contribution = (Energy.Expression == EnergyExpression::NonCumulant) ? Terms.NonCumulant() : Terms.Cumulant();
        Out << "BE-DMET: -- Energy of Fragment " << Terms.FragmentId << " is " << std::setw(14) << Contribution << " Ha" << std::endl;
    }
    if (Energy.Expression == EnergyExpression::NonCumulant)
    {
        Out << "BE-DMET: E_BE = E_1 + E_C + E_2 + E_nuc" << std::endl;
        Out << "BE-DMET:   E_1   = " << std::setw(14) << Energy.E1 << " Ha" << std::endl;
        Out << "BE-DMET:   E_C   = " << std::setw(14) << Energy.EC << " Ha" << std::endl;
        Out << "BE-DMET:   E_2   = " << std::setw(14) << Energy.E2 << " Ha" << std::endl;
        Out << "BE-DMET:   E_nuc = " << std::setw(14) << Energy.ENuc << " Ha" << std::endl;
    }
    else
    {
        Out << "BE-DMET: E_BE = E_HF + Tr(F del g) + Tr(V K_approx)" << std::endl;
        Out << "BE-DMET:   E_HF             = " << std::setw(14) << Energy.EHF << " Ha" << std::endl;
        Out << "BE-DMET:   Tr(F del g)      = " << std::setw(14) << Energy.TrFdg << " Ha" << std::endl;
        Out << "BE-DMET:   Tr(V K_approx)   = " << std::setw(14) << Energy.TrVK << " Ha" << std::endl;
    }
    Out << "BE-DMET: E_BE   = " << std::setw(14) << Energy.Total << " Ha" << std::endl;
    Out << "BE-DMET: E_corr = " << std::setw(14) << Energy.Correlation << " Ha" << std::endl;
    Out << std::defaultfloat << std::setprecision(6);
}
