#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <map>
#include <iomanip>
#include <algorithm>
#include "CorrelationPotential.h"

void CorrelationPotential::InitFromFragments(const std::vector< Fragment > &Frags, bool MatchFullP)
{
	std::map< std::pair< int, int >, int > AtomOfKey;
	for (int x = 0; x < Frags.size(); x++)
	{
		for (int e = 0; e < Frags[x].Edges.size(); e++)
		{
			const EdgeGroup &Edge = Frags[x].Edges[e];
			for (int a = 0; a < Edge.Sites.size(); a++)
			{
				for (int b = a; b < Edge.Sites.size(); b++)
				{
					if (!MatchFullP && a != b) continue;
					int i = std::min(Edge.Sites[a], Edge.Sites[b]);
					int j = std::max(Edge.Sites[a], Edge.Sites[b]);
					AtomOfKey[std::make_pair(i, j)] = Edge.Atom;
				}
			}
		}
	}

	Keys.clear();
	KeyAtom.clear();
	Index.clear();
	for (std::map< std::pair< int, int >, int >::iterator it = AtomOfKey.begin(); it != AtomOfKey.end(); it++)
	{
		Index[it->first] = Keys.size();
		Keys.push_back(it->first);
		KeyAtom.push_back(it->second);
	}
	Values = Eigen::VectorXd::Zero(Keys.size());
	ChemicalPotential = 0;
	Version = 0;
}

int CorrelationPotential::Find(int i, int j) const
{
	std::map< std::pair< int, int >, int >::const_iterator it = Index.find(std::make_pair(std::min(i, j), std::max(i, j)));
	if (it == Index.end()) return -1;
	return it->second;
}

double CorrelationPotential::Value(int i, int j) const
{
	int k = Find(i, j);
	if (k < 0) return 0;
	return Values[k];
}

Eigen::VectorXd CorrelationPotential::ToVector(bool WithSitePotential) const
{
	if (!WithSitePotential)
	{
		Eigen::VectorXd x(1);
		x[0] = ChemicalPotential;
		return x;
	}
	Eigen::VectorXd x(Keys.size() + 1);
	x.head(Keys.size()) = Values;
	x[Keys.size()] = ChemicalPotential;
	return x;
}

CorrelationPotential CorrelationPotential::FromVector(const Eigen::VectorXd &x, bool WithSitePotential) const
{
	CorrelationPotential Next(*this);
	if (WithSitePotential)
	{
		Next.Values = x.head(Keys.size());
		Next.ChemicalPotential = x[Keys.size()];
	}
	else
	{
		Next.ChemicalPotential = x[0];
	}
	Next.Version = Version + 1;
	return Next;
}

void CorrelationPotential::PrintPotential(std::ostream &Out) const
{
	Out << "BE-DMET: Potential version " << Version << std::endl;
	Out << "BE-DMET: Chemical potential = " << std::setprecision(10) << ChemicalPotential << std::endl;
	for (int k = 0; k < Keys.size(); k++)
	{
		Out << "BE-DMET: Edge atom " << KeyAtom[k] << " sites " << Keys[k].first << " " << Keys[k].second << "\t" << Values[k] << std::endl;
	}
}
