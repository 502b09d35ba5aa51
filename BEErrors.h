#pragma once
#include <stdexcept>
#include <string>

// Fatal errors raised by the embedding code. Each carries the fragment and the outer
// iteration it happened in, -1 when that does not apply.
class BEError : public std::runtime_error
{
public:
	int FragmentId;
	int Iteration;

	BEError(const std::string &Message, int Frag = -1, int Iter = -1)
		: std::runtime_error(Decorate(Message, Frag, Iter)), FragmentId(Frag), Iteration(Iter) {}

private:
	static std::string Decorate(const std::string &Message, int Frag, int Iter)
	{
		std::string Out = Message;
		if (Frag >= 0) Out += " (fragment " + std::to_string(Frag);
		if (Frag >= 0 && Iter >= 0) Out += ", iteration " + std::to_string(Iter) + ")";
		else if (Frag >= 0) Out += ")";
		else if (Iter >= 0) Out += " (iteration " + std::to_string(Iter) + ")";
		return Out;
	}
};

// Bad input: expansion order, strategy name, keyword, element symbol.
class ConfigurationError : public BEError
{
public:
	ConfigurationError(const std::string &Message) : BEError(Message) {}
};

class GeometryError : public BEError
{
public:
	GeometryError(const std::string &Message) : BEError(Message) {}
};

// The Schmidt decomposition could not give a subspace with the right electron count.
class SubspaceError : public BEError
{
public:
	SubspaceError(const std::string &Message, int Frag, int Iter = 0) : BEError(Message, Frag, Iter) {}
};

class SolverDivergence : public BEError
{
public:
	SolverDivergence(const std::string &Message, int Frag, int Iter) : BEError(Message, Frag, Iter) {}
};

class MeanFieldError : public BEError
{
public:
	MeanFieldError(const std::string &Message) : BEError(Message) {}
};
