
#ifndef AST_H_
#define AST_H_

#include <boost/variant.hpp>

#include <vector>

namespace RegVM {

struct CharNode;
struct OrNode;
struct SeqNode;
struct StarNode;
struct PlusNode;
struct QuestionNode;

struct CharNode {
	char ch;
};

// A syntax tree. Composite nodes own their children.
using Node = boost::variant<
	CharNode,
	boost::recursive_wrapper<OrNode>,
	boost::recursive_wrapper<SeqNode>,
	boost::recursive_wrapper<StarNode>,
	boost::recursive_wrapper<PlusNode>,
	boost::recursive_wrapper<QuestionNode>>;

// left|right
struct OrNode {
	Node left;
	Node right;
};

// Concatenation. Empty only for the empty pattern.
struct SeqNode {
	std::vector<Node> nodes;
};

// node*
struct StarNode {
	Node node;
};

// node+
struct PlusNode {
	Node node;
};

// node?
struct QuestionNode {
	Node node;
};

}

#endif
