#pragma once
#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <map>
#include <utility>
#include "Fragmenting.h"

// Potential on the edge sites, shared by every fragment that sees the same atom as an edge.
// Values are keyed by pairs of global sites (i <= j) on one edge atom. An object is never changed
// after it is handed to the fragments; an update makes a new object with the next version number.
class CorrelationPotential
{
public:
	int Version = 0;
	double ChemicalPotential = 0;
	std::vector< std::pair< int, int > > Keys;
	std::vector< int > KeyAtom;
	Eigen::VectorXd Values;

	void InitFromFragments(const std::vector< Fragment >&, bool);
	int Find(int, int) const;
	double Value(int, int) const;
	int NumKeys() const { return Keys.size(); }

	// Parameter vector seen by the Newton solver, with the chemical potential as the last element.
	Eigen::VectorXd ToVector(bool) const;
	CorrelationPotential FromVector(const Eigen::VectorXd&, bool) const;

	void PrintPotential(std::ostream&) const;

private:
	std::map< std::pair< int, int >, int > Index;
};
