#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "Functions.h"
#include "BEErrors.h"

// Integer that follows "Key=" in an FCIDUMP namelist header.
static int HeaderValue(const std::string &Header, const std::string &Key)
{
    size_t Pos = Header.find(Key);
    if (Pos == std::string::npos)
    {
        throw ConfigurationError("FCIDUMP header has no " + Key);
    }
    Pos = Header.find('=', Pos);
    std::stringstream Value(Header.substr(Pos + 1));
    int Out;
    Value >> Out;
    return Out;
}

/*****                                    FORMAT OF THE INTEGRAL FILE                              *****/
/* Integrals are read from a standard FCIDUMP file. The namelist header gives the number of orbitals and
   electrons, and every following line is
                (ij|kl)     i   j   k   l
   with 1-based indices in chemists' notation. Only one of the eight permutationally equivalent
   integrals needs to be listed. Lines with k = l = 0 are one electron integrals h_ij, and the line
   with all indices zero is the core energy (nuclear repulsion).                                       */
void ReadFCIDUMP(const std::string &FileName, Eigen::MatrixXd &HCore, Eigen::Tensor<double, 4> &ERI, double &ECore, int &NumOrbitals, int &NumElectrons)
{
    std::ifstream IntegralsFile(FileName.c_str());
    if (!IntegralsFile.is_open())
    {
        throw ConfigurationError("Cannot open integral file " + FileName);
    }

    std::string Header, Line;
    while (std::getline(IntegralsFile, Line))
    {
        Header += Line + " ";
        if (Line.find("&END") != std::string::npos || Line.find("/") != std::string::npos) break;
    }
    NumOrbitals = HeaderValue(Header, "NORB");
    NumElectrons = HeaderValue(Header, "NELEC");

    int N = NumOrbitals;
    HCore = Eigen::MatrixXd::Zero(N, N);
    ERI = Eigen::Tensor<double, 4>(N, N, N, N);
    ERI.setZero();
    ECore = 0;

    double tmpDouble;
    int i, j, k, l;
    while (IntegralsFile >> tmpDouble >> i >> j >> k >> l)
    {
        if (i > N || j > N || k > N || l > N || i < 0 || j < 0 || k < 0 || l < 0)
        {
            throw ConfigurationError("Integral index out of range in " + FileName);
        }
        if (i == 0 && j == 0 && k == 0 && l == 0)
        {
            ECore = tmpDouble;
            continue;
        }
        if (k == 0 && l == 0)
        {
            if (j == 0) continue; // Orbital energies, not needed.
            HCore(i - 1, j - 1) = tmpDouble;
            HCore(j - 1, i - 1) = tmpDouble;
            continue;
        }
        /* We have to include all 8-fold permuation symmetries. */
        i--; j--; k--; l--;
        ERI(i, j, k, l) = tmpDouble;
        ERI(j, i, k, l) = tmpDouble;
        ERI(i, j, l, k) = tmpDouble;
        ERI(j, i, l, k) = tmpDouble;
        ERI(k, l, i, j) = tmpDouble;
        ERI(l, k, i, j) = tmpDouble;
        ERI(k, l, j, i) = tmpDouble;
        ERI(l, k, j, i) = tmpDouble;
    }
}

void WriteFCIDUMP(const std::string &FileName, const Eigen::MatrixXd &HCore, const Eigen::Tensor<double, 4> &ERI, double ECore, int NumElectrons)
{
    std::ofstream FCIDUMP(FileName.c_str());
    if (!FCIDUMP.is_open())
    {
        throw ConfigurationError("Cannot write " + FileName);
    }
    int N = HCore.rows();
    FCIDUMP << " &FCI NORB=" << N << ",NELEC=" << NumElectrons << ",MS2=0," << std::endl;
    FCIDUMP << "  ORBSYM=";
    for (int i = 0; i < N; i++) FCIDUMP << "1,";
    FCIDUMP << std::endl << "  ISYM=1," << std::endl << " &END" << std::endl;

    FCIDUMP << std::scientific << std::setprecision(16);
    for (int i = 0; i < N; i++)
    {
        for (int j = 0; j <= i; j++)
        {
            for (int k = 0; k < N; k++)
            {
                for (int l = 0; l <= k; l++)
                {
                    if (i * (i + 1) / 2 + j < k * (k + 1) / 2 + l) continue;
                    if (fabs(ERI(i, j, k, l)) < 1E-14) continue;
                    FCIDUMP << std::setw(25) << ERI(i, j, k, l) << " " << i + 1 << " " << j + 1 << " " << k + 1 << " " << l + 1 << std::endl;
                }
            }
        }
    }
    for (int i = 0; i < N; i++)
    {
        for (int j = 0; j <= i; j++)
        {
            if (fabs(HCore(i, j)) < 1E-14) continue;
            FCIDUMP << std::setw(25) << HCore(i, j) << " " << i + 1 << " " << j + 1 << " 0 0" << std::endl;
        }
    }
    FCIDUMP << std::setw(25) << ECore << " 0 0 0 0" << std::endl;
}

// Lines of "i j S_ij" with 1-based indices. OverlapMatrix must already have its final size.
void ReadOverlap(const std::string &FileName, Eigen::MatrixXd &OverlapMatrix)
{
    std::ifstream OverlapFile(FileName.c_str());
    if (!OverlapFile.is_open())
    {
        throw ConfigurationError("Cannot open overlap file " + FileName);
    }
    OverlapMatrix.setZero();
    int i, j;
    double tmpDouble;
    while (OverlapFile >> i >> j >> tmpDouble)
    {
        if (i < 1 || j < 1 || i > OverlapMatrix.rows() || j > OverlapMatrix.rows())
        {
            throw ConfigurationError("Overlap index out of range in " + FileName);
        }
        OverlapMatrix(i - 1, j - 1) = tmpDouble;
        OverlapMatrix(j - 1, i - 1) = tmpDouble;
    }
}

/* Binary two electron cache of one fragment: the dimension, the fingerprint of the basis and the
   integrals it came from, then n^4 doubles in column major order. Returns false when the file is
   missing, truncated, of another dimension or was built for another problem. */
bool ReadERICache(const std::string &FileName, Eigen::Tensor<double, 4> &ERI, int NumOrbitals, double Fingerprint)
{
    std::ifstream Cache(FileName.c_str(), std::ios::binary);
    if (!Cache.is_open()) return false;
    int n = 0;
    double Stamp = 0;
    Cache.read(reinterpret_cast<char*>(&n), sizeof(int));
    Cache.read(reinterpret_cast<char*>(&Stamp), sizeof(double));
    if (!Cache || n != NumOrbitals) return false;
    if (fabs(Stamp - Fingerprint) > 1E-10 * std::max(1.0, fabs(Fingerprint))) return false;
    Eigen::Tensor<double, 4> Stored(n, n, n, n);
    Cache.read(reinterpret_cast<char*>(Stored.data()), sizeof(double) * Stored.size());
    if (!Cache) return false;
    ERI = Stored;
    return true;
}

// Written to a temporary name first, so a reader never sees half a file.
void WriteERICache(const std::string &FileName, const Eigen::Tensor<double, 4> &ERI, double Fingerprint)
{
    std::string TmpName = FileName + ".tmp";
    {
        std::ofstream Cache(TmpName.c_str(), std::ios::binary | std::ios::trunc);
        if (!Cache.is_open())
        {
            throw ConfigurationError("Cannot write integral cache " + TmpName);
        }
        int n = ERI.dimension(0);
        Cache.write(reinterpret_cast<const char*>(&n), sizeof(int));
        Cache.write(reinterpret_cast<const char*>(&Fingerprint), sizeof(double));
        Cache.write(reinterpret_cast<const char*>(ERI.data()), sizeof(double) * ERI.size());
        if (!Cache)
        {
            throw ConfigurationError("Failed writing integral cache " + TmpName);
        }
    }
    if (std::rename(TmpName.c_str(), FileName.c_str()) != 0)
    {
        throw ConfigurationError("Cannot move integral cache into place at " + FileName);
    }
}

void SavePotential(const std::string &FileName, const CorrelationPotential &Potential)
{
    std::ofstream PotFile(FileName.c_str());
    if (!PotFile.is_open())
    {
        throw ConfigurationError("Cannot write potential file " + FileName);
    }
    PotFile << std::setprecision(17);
    PotFile << "version " << Potential.Version << std::endl;
    PotFile << "mu " << Potential.ChemicalPotential << std::endl;
    for (int k = 0; k < Potential.NumKeys(); k++)
    {
        PotFile << Potential.Keys[k].first << " " << Potential.Keys[k].second << " " << Potential.Values[k] << std::endl;
    }
}

// Values are matched by site pair against the potential of the current fragmentation.
CorrelationPotential LoadPotential(const std::string &FileName, const CorrelationPotential &Template)
{
    std::ifstream PotFile(FileName.c_str());
    if (!PotFile.is_open())
    {
        throw ConfigurationError("Cannot open potential file " + FileName);
    }
    CorrelationPotential Potential(Template);
    Potential.Values.setZero();
    std::string Line;
    while (std::getline(PotFile, Line))
    {
        std::stringstream LineStream(Line);
        std::string First;
        if (!(LineStream >> First)) continue;
        if (First == "version" || First == "mu")
        {
            bool Read = (First == "version") ? static_cast<bool>(LineStream >> Potential.Version) : static_cast<bool>(LineStream >> Potential.ChemicalPotential);
            if (!Read)
            {
                throw ConfigurationError("Malformed line in potential file " + FileName + ": " + Line);
            }
            continue;
        }
        int i;
        try
        {
            size_t Used;
            i = std::stoi(First, &Used);
            if (Used != First.size()) throw std::invalid_argument(First);
        }
        catch (const std::logic_error&)
        {
            throw ConfigurationError("Potential file " + FileName + " expected a site index, got \"" + First + "\"");
        }
        int j;
        double Value;
        if (!(LineStream >> j >> Value))
        {
            throw ConfigurationError("Malformed line in potential file " + FileName + ": " + Line);
        }
        int k = Potential.Find(i, j);
        if (k < 0)
        {
            throw ConfigurationError("Potential file " + FileName + " has sites " + std::to_string(i) + " " + std::to_string(j) + " which are not an edge of this fragmentation");
        }
        Potential.Values[k] = Value;
    }
    return Potential;
}
