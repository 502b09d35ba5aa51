#include <iostream>
#include <Eigen/Dense>
#include <vector>
#include <cmath>
#include <string>
#include <map>
#include <set>
#include <queue>
#include <algorithm>
#include <utility>
#include "Fragmenting.h"
#include "BEErrors.h"

PartitionStrategy ParsePartitionStrategy(const std::string &Name)
{
    if (Name == "autogen" || Name == "chemgen") return PartitionStrategy::Autogen;
    if (Name == "chain" || Name == "polychain") return PartitionStrategy::Chain;
    if (Name == "user") return PartitionStrategy::User;
    throw ConfigurationError("Fragmentation type = " + Name + " not implemented!");
}

std::string StrategyName(PartitionStrategy Strategy)
{
    switch (Strategy)
    {
    case PartitionStrategy::Autogen: return "autogen";
    case PartitionStrategy::Chain: return "chain";
    default: return "user";
    }
}

int Fragment::LocalIndex(int Site) const
{
    std::vector< int >::const_iterator it = std::lower_bound(Sites.begin(), Sites.end(), Site);
    if (it == Sites.end() || *it != Site) return -1;
    return it - Sites.begin();
}

std::vector< int > Fragment::CenterIndex() const
{
    std::vector< int > Index;
    for (int i = 0; i < CenterSites.size(); i++) Index.push_back(LocalIndex(CenterSites[i]));
    return Index;
}

bool Fragment::isCenterAtom(int Atom) const
{
    return std::find(CenterAtoms.begin(), CenterAtoms.end(), Atom) != CenterAtoms.end();
}

void Fragmenting::Generate(const BondGraph &Graph)
{
    if (BEOrder < 1)
    {
        throw ConfigurationError("Invalid expansion order " + std::to_string(BEOrder) + ", it must be at least 1");
    }
    AdjacencyMatrix = Graph.AdjacencyMatrix;
    Fragments.clear();
    CenterPosition.clear();

    if (Strategy == PartitionStrategy::Autogen) AutogenIteration(Graph);
    else if (Strategy == PartitionStrategy::Chain) ChainIteration(Graph);
    else UserIteration(Graph);

    SortByCenter();
    BuildFragments(Graph.NumAtoms);
}

/* Every atom (every heavy atom when hydrogens are treated separately) is the center of a ball of
   BEOrder bond hops. A ball contained in another ball adds nothing, so it is dropped and its center
   is handed to the first maximal ball containing it. */
void Fragmenting::AutogenIteration(const BondGraph &Graph)
{
    int N = Graph.NumAtoms;
    std::vector< std::vector< int > > AllComponents = Graph.Components();
    if (AllComponents.size() > 1)
    {
        std::string Message = "Bond graph splits into " + std::to_string(AllComponents.size()) + " disconnected pieces:";
        for (int i = 0; i < AllComponents.size(); i++)
        {
            Message += " {";
            for (int j = 0; j < AllComponents[i].size(); j++) Message += (j == 0 ? "" : ",") + std::to_string(AllComponents[i][j]);
            Message += "}";
        }
        throw GeometryError(Message);
    }

    // Hydrogens hang off the closest bonded heavy atom and do not count as hops.
    std::vector< bool > isNode(N, true);
    std::vector< std::vector< int > > Attached(N);
    bool HasHeavy = false;
    for (int i = 0; i < N; i++) if (!Graph.isHydrogen(i)) HasHeavy = true;
    if (TreatHydrogens && HasHeavy)
    {
        for (int i = 0; i < N; i++)
        {
            if (!Graph.isHydrogen(i)) continue;
            std::vector< int > Adjacent = Graph.Neighbors(i);
            int Host = -1;
            double HostDist = 0;
            for (int j = 0; j < Adjacent.size(); j++)
            {
                if (Graph.isHydrogen(Adjacent[j])) continue;
                double Dist = Graph.Distance(i, Adjacent[j]);
                if (Host < 0 || Dist < HostDist)
                {
                    Host = Adjacent[j];
                    HostDist = Dist;
                }
            }
            if (Host < 0) continue; // A hydrogen with no heavy neighbor stays a node.
            isNode[i] = false;
            Attached[Host].push_back(i);
        }
    }

    std::vector< int > Nodes;
    std::vector< std::vector< int > > Balls;
    for (int c = 0; c < N; c++)
    {
        if (!isNode[c]) continue;
        std::vector< int > Depth(N, -1);
        std::queue< int > Queue;
        Queue.push(c);
        Depth[c] = 0;
        std::vector< int > Ball;
        while (!Queue.empty())
        {
            int Atom = Queue.front();
            Queue.pop();
            Ball.push_back(Atom);
            if (Depth[Atom] == BEOrder) continue;
            std::vector< int > Adjacent = Graph.Neighbors(Atom);
            for (int i = 0; i < Adjacent.size(); i++)
            {
                if (!isNode[Adjacent[i]] || Depth[Adjacent[i]] >= 0) continue;
                Depth[Adjacent[i]] = Depth[Atom] + 1;
                Queue.push(Adjacent[i]);
            }
        }
        std::sort(Ball.begin(), Ball.end());
        Nodes.push_back(c);
        Balls.push_back(Ball);
    }

    // A ball is maximal if no other ball strictly contains it; equal balls keep the first.
    int NumBalls = Balls.size();
    std::vector< bool > isMaximal(NumBalls, true);
    for (int f = 0; f < NumBalls; f++)
    {
        for (int g = 0; g < NumBalls; g++)
        {
            if (f == g) continue;
            bool Contained = std::includes(Balls[g].begin(), Balls[g].end(), Balls[f].begin(), Balls[f].end());
            if (!Contained) continue;
            if (Balls[f].size() < Balls[g].size() || g < f)
            {
                isMaximal[f] = false;
                break;
            }
        }
    }

    std::vector< int > FragOfBall(NumBalls, -1);
    std::vector< std::vector< int > > CenterNodes;
    for (int f = 0; f < NumBalls; f++)
    {
        if (!isMaximal[f]) continue;
        FragOfBall[f] = CenterNodes.size();
        Fragments.push_back(Balls[f]);
        CenterNodes.push_back(std::vector< int >(1, Nodes[f]));
    }
    for (int f = 0; f < NumBalls; f++)
    {
        if (isMaximal[f]) continue;
        for (int g = 0; g < NumBalls; g++)
        {
            if (!isMaximal[g]) continue;
            if (std::includes(Balls[g].begin(), Balls[g].end(), Balls[f].begin(), Balls[f].end()))
            {
                CenterNodes[FragOfBall[g]].push_back(Nodes[f]);
                break;
            }
        }
    }

    for (int x = 0; x < Fragments.size(); x++)
    {
        std::vector< int > Atoms = Fragments[x];
        for (int i = 0; i < Fragments[x].size(); i++)
        {
            Atoms.insert(Atoms.end(), Attached[Fragments[x][i]].begin(), Attached[Fragments[x][i]].end());
        }
        std::vector< int > Centers = CenterNodes[x];
        for (int i = 0; i < CenterNodes[x].size(); i++)
        {
            Centers.insert(Centers.end(), Attached[CenterNodes[x][i]].begin(), Attached[CenterNodes[x][i]].end());
        }
        std::sort(Atoms.begin(), Atoms.end());
        std::sort(Centers.begin(), Centers.end());
        Fragments[x] = Atoms;
        CenterPosition.push_back(Centers);
    }
}

// Sliding window of BEOrder + 1 atoms along the atom ordering. The last window owns all of its atoms.
void Fragmenting::ChainIteration(const BondGraph &Graph)
{
    int N = Graph.NumAtoms;
    for (int i = 0; i < N - 1; i++)
    {
        if (Graph.AdjacencyMatrix(i, i + 1) != 1)
        {
            throw GeometryError("Chain is broken between atoms " + std::to_string(i) + " and " + std::to_string(i + 1));
        }
    }

    if (N <= BEOrder + 1)
    {
        std::vector< int > All;
        for (int i = 0; i < N; i++) All.push_back(i);
        Fragments.push_back(All);
        CenterPosition.push_back(All);
        return;
    }

    for (int k = 0; k < N - BEOrder; k++)
    {
        std::vector< int > xFrag, xCenter;
        for (int i = k; i <= k + BEOrder; i++) xFrag.push_back(i);
        if (k == N - BEOrder - 1) xCenter = xFrag;
        else xCenter.push_back(k);
        Fragments.push_back(xFrag);
        CenterPosition.push_back(xCenter);
    }
}

void Fragmenting::UserIteration(const BondGraph &Graph)
{
    if (UserFragments.empty())
    {
        throw ConfigurationError("User partition selected but no fragments were given");
    }
    if (UserCenters.size() != UserFragments.size())
    {
        throw ConfigurationError("Every user fragment needs a list of center atoms");
    }
    for (int x = 0; x < UserFragments.size(); x++)
    {
        std::vector< int > xFrag = UserFragments[x];
        std::vector< int > xCenter = UserCenters[x];
        std::sort(xFrag.begin(), xFrag.end());
        xFrag.erase(std::unique(xFrag.begin(), xFrag.end()), xFrag.end());
        std::sort(xCenter.begin(), xCenter.end());
        xCenter.erase(std::unique(xCenter.begin(), xCenter.end()), xCenter.end());
        for (int i = 0; i < xFrag.size(); i++)
        {
            if (xFrag[i] < 0 || xFrag[i] >= Graph.NumAtoms)
            {
                throw ConfigurationError("User fragment " + std::to_string(x) + " refers to atom " + std::to_string(xFrag[i]) + " which does not exist");
            }
        }
        if (xCenter.empty())
        {
            throw ConfigurationError("User fragment " + std::to_string(x) + " has no center atom");
        }
        for (int i = 0; i < xCenter.size(); i++)
        {
            if (!std::binary_search(xFrag.begin(), xFrag.end(), xCenter[i]))
            {
                throw ConfigurationError("Center atom " + std::to_string(xCenter[i]) + " is not part of user fragment " + std::to_string(x));
            }
        }
        Fragments.push_back(xFrag);
        CenterPosition.push_back(xCenter);
    }
}

void Fragmenting::SortByCenter()
{
    std::vector< int > Order(Fragments.size());
    for (int x = 0; x < Order.size(); x++) Order[x] = x;
    std::stable_sort(Order.begin(), Order.end(), [this](int a, int b) { return CenterPosition[a][0] < CenterPosition[b][0]; });

    std::vector< std::vector< int > > SortedFrag, SortedCenter;
    for (int x = 0; x < Order.size(); x++)
    {
        SortedFrag.push_back(Fragments[Order[x]]);
        SortedCenter.push_back(CenterPosition[Order[x]]);
    }
    Fragments = SortedFrag;
    CenterPosition = SortedCenter;
}

// Expands atoms into sites, assigns weights and finds the owner of every edge atom.
void Fragmenting::BuildFragments(int NumAtoms)
{
    std::vector< int > SiteAtom = OrbitalAtom;
    if (SiteAtom.empty())
    {
        for (int i = 0; i < NumAtoms; i++) SiteAtom.push_back(i);
    }
    std::vector< std::vector< int > > AtomSites(NumAtoms);
    for (int s = 0; s < SiteAtom.size(); s++)
    {
        if (SiteAtom[s] < 0 || SiteAtom[s] >= NumAtoms)
        {
            throw ConfigurationError("Orbital " + std::to_string(s) + " is assigned to atom " + std::to_string(SiteAtom[s]) + " which does not exist");
        }
        AtomSites[SiteAtom[s]].push_back(s);
    }

    std::vector< int > CenterCount(NumAtoms, 0);
    std::vector< int > Owner(NumAtoms, -1);
    for (int x = 0; x < Fragments.size(); x++)
    {
        for (int i = 0; i < CenterPosition[x].size(); i++)
        {
            int Atom = CenterPosition[x][i];
            CenterCount[Atom]++;
            if (Owner[Atom] < 0) Owner[Atom] = x;
        }
    }
    for (int a = 0; a < NumAtoms; a++)
    {
        if (CenterCount[a] == 0)
        {
            throw ConfigurationError("Atom " + std::to_string(a) + " is not the center of any fragment");
        }
    }

    Frags.clear();
    for (int x = 0; x < Fragments.size(); x++)
    {
        Fragment Frag;
        Frag.Id = x;
        Frag.Atoms = Fragments[x];
        Frag.CenterAtoms = CenterPosition[x];
        for (int i = 0; i < Frag.Atoms.size(); i++)
        {
            int Atom = Frag.Atoms[i];
            Frag.Sites.insert(Frag.Sites.end(), AtomSites[Atom].begin(), AtomSites[Atom].end());
            if (Frag.isCenterAtom(Atom))
            {
                Frag.CenterSites.insert(Frag.CenterSites.end(), AtomSites[Atom].begin(), AtomSites[Atom].end());
                continue;
            }
            Frag.EdgeAtoms.push_back(Atom);
            Frag.EdgeSites.insert(Frag.EdgeSites.end(), AtomSites[Atom].begin(), AtomSites[Atom].end());
            EdgeGroup Edge;
            Edge.Atom = Atom;
            Edge.Owner = Owner[Atom];
            Edge.Sites = AtomSites[Atom];
            Frag.Edges.push_back(Edge);
        }
        std::sort(Frag.Sites.begin(), Frag.Sites.end());
        std::sort(Frag.CenterSites.begin(), Frag.CenterSites.end());
        std::sort(Frag.EdgeSites.begin(), Frag.EdgeSites.end());
        for (int i = 0; i < Frag.Sites.size(); i++)
        {
            int Atom = SiteAtom[Frag.Sites[i]];
            Frag.Weights.push_back(Frag.isCenterAtom(Atom) ? 1.0 / CenterCount[Atom] : 0.0);
        }
        Frags.push_back(Frag);
    }
}

void Fragmenting::PrintFrag(std::ostream &Out) const
{
    Out << "BE-DMET: " << Frags.size() << " fragments from " << StrategyName(Strategy) << " partitioning of order " << BEOrder << std::endl;
    for (int x = 0; x < Frags.size(); x++)
    {
        Out << "BE-DMET: Fragment " << x << " atoms:";
        for (int i = 0; i < Frags[x].Atoms.size(); i++) Out << " " << Frags[x].Atoms[i];
        Out << " | centers:";
        for (int i = 0; i < Frags[x].CenterAtoms.size(); i++) Out << " " << Frags[x].CenterAtoms[i];
        Out << " | edges:";
        for (int i = 0; i < Frags[x].Edges.size(); i++) Out << " " << Frags[x].Edges[i].Atom << "->" << Frags[x].Edges[i].Owner;
        Out << std::endl;
    }
}
