#ifndef EXPRESSION_HPP
#define EXPRESSION_HPP

#include "numeric/field.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ExpressionNodeType : std::uint8_t {
    Constant,
    VariableX,
    VariableY,
    Negate,
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Abs,
    Min,
    Max
};

struct ExpressionNode {
    ExpressionNodeType type;

    // Indices of the operands in the node list (unused operands are 0)
    std::size_t lhs;
    std::size_t rhs;

    // Index into the constant list for constants, the exponent for powers
    std::size_t data;

    bool operator==(const ExpressionNode&) const = default;
};

template <typename T>
struct ValueWithGradient {
    T value;
    T dx;
    T dy;
};

// A payoff function of two variables.
// Nodes are stored in creation order, so every operand precedes the nodes that use it
// and the whole expression can be evaluated in a single forward pass.
template <NumericField T>
class Expression {
public:
    std::size_t addConstant(const T& value) {
        m_constants.push_back(value);
        return addNode(ExpressionNode{ ExpressionNodeType::Constant, 0, 0, m_constants.size() - 1 });
    }

    std::size_t addVariableX() {
        return addNode(ExpressionNode{ ExpressionNodeType::VariableX, 0, 0, 0 });
    }

    std::size_t addVariableY() {
        return addNode(ExpressionNode{ ExpressionNodeType::VariableY, 0, 0, 0 });
    }

    std::size_t addUnary(ExpressionNodeType type, std::size_t operand) {
        assert(type == ExpressionNodeType::Negate || type == ExpressionNodeType::Abs);
        assert(operand < m_nodes.size());
        return addNode(ExpressionNode{ type, operand, 0, 0 });
    }

    std::size_t addBinary(ExpressionNodeType type, std::size_t lhs, std::size_t rhs) {
        assert(isBinary(type));
        assert(lhs < m_nodes.size() && rhs < m_nodes.size());
        return addNode(ExpressionNode{ type, lhs, rhs, 0 });
    }

    std::size_t addPower(std::size_t base, std::size_t exponent) {
        assert(base < m_nodes.size());
        return addNode(ExpressionNode{ ExpressionNodeType::Power, base, 0, exponent });
    }

    // The most recently added node is the root
    bool isEmpty() const {
        return m_nodes.empty();
    }

    std::size_t getRootIndex() const {
        assert(!m_nodes.empty());
        return m_nodes.size() - 1;
    }

    const std::vector<ExpressionNode>& getNodes() const {
        return m_nodes;
    }

    const std::vector<T>& getConstants() const {
        return m_constants;
    }

    T evaluate(const T& x, const T& y) const {
        assert(!m_nodes.empty());

        std::vector<T> values;
        values.reserve(m_nodes.size());

        for (const ExpressionNode& node : m_nodes) {
            switch (node.type) {
                case ExpressionNodeType::Constant:
                    values.push_back(m_constants[node.data]);
                    break;
                case ExpressionNodeType::VariableX:
                    values.push_back(x);
                    break;
                case ExpressionNodeType::VariableY:
                    values.push_back(y);
                    break;
                case ExpressionNodeType::Negate:
                    values.push_back(T(-values[node.lhs]));
                    break;
                case ExpressionNodeType::Add:
                    values.push_back(T(values[node.lhs] + values[node.rhs]));
                    break;
                case ExpressionNodeType::Subtract:
                    values.push_back(T(values[node.lhs] - values[node.rhs]));
                    break;
                case ExpressionNodeType::Multiply:
                    values.push_back(T(values[node.lhs] * values[node.rhs]));
                    break;
                case ExpressionNodeType::Divide:
                    values.push_back(divide(values[node.lhs], values[node.rhs]));
                    break;
                case ExpressionNodeType::Power:
                    values.push_back(raiseToPower(values[node.lhs], node.data));
                    break;
                case ExpressionNodeType::Abs:
                    values.push_back(absoluteValue(values[node.lhs]));
                    break;
                case ExpressionNodeType::Min:
                    values.push_back((values[node.rhs] < values[node.lhs]) ? values[node.rhs] : values[node.lhs]);
                    break;
                case ExpressionNodeType::Max:
                    values.push_back((values[node.lhs] < values[node.rhs]) ? values[node.rhs] : values[node.lhs]);
                    break;
                default:
                    assert(false);
                    break;
            }
        }

        const T& result = values.back();
        checkFinite(result, "payoff evaluation");
        return result;
    }

    // Forward-mode differentiation. Where the function is not differentiable
    // (abs at zero, min / max at a tie) a valid subgradient is returned.
    ValueWithGradient<T> evaluateWithGradient(const T& x, const T& y) const {
        assert(!m_nodes.empty());

        const T zero = FieldTraits<T>::zero();
        const T one = FieldTraits<T>::one();

        std::vector<ValueWithGradient<T>> values;
        values.reserve(m_nodes.size());

        for (const ExpressionNode& node : m_nodes) {
            switch (node.type) {
                case ExpressionNodeType::Constant:
                    values.push_back({ m_constants[node.data], zero, zero });
                    break;
                case ExpressionNodeType::VariableX:
                    values.push_back({ x, one, zero });
                    break;
                case ExpressionNodeType::VariableY:
                    values.push_back({ y, zero, one });
                    break;
                case ExpressionNodeType::Negate: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    values.push_back({ T(-u.value), T(-u.dx), T(-u.dy) });
                    break;
                }
                case ExpressionNodeType::Add: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    values.push_back({ T(u.value + v.value), T(u.dx + v.dx), T(u.dy + v.dy) });
                    break;
                }
                case ExpressionNodeType::Subtract: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    values.push_back({ T(u.value - v.value), T(u.dx - v.dx), T(u.dy - v.dy) });
                    break;
                }
                case ExpressionNodeType::Multiply: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    values.push_back({
                        T(u.value * v.value),
                        T(u.dx * v.value + u.value * v.dx),
                        T(u.dy * v.value + u.value * v.dy)
                    });
                    break;
                }
                case ExpressionNodeType::Divide: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    T quotient = divide(u.value, v.value);
                    values.push_back({
                        quotient,
                        divide(T(u.dx - quotient * v.dx), v.value),
                        divide(T(u.dy - quotient * v.dy), v.value)
                    });
                    break;
                }
                case ExpressionNodeType::Power: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    std::size_t exponent = node.data;
                    if (exponent == 0) {
                        values.push_back({ one, zero, zero });
                        break;
                    }

                    T lowerPower = raiseToPower(u.value, exponent - 1);
                    T factor = FieldTraits<T>::fromInteger(static_cast<std::int64_t>(exponent)) * lowerPower;
                    values.push_back({ T(lowerPower * u.value), T(factor * u.dx), T(factor * u.dy) });
                    break;
                }
                case ExpressionNodeType::Abs: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    int sign = signOf(u.value);
                    if (sign < 0) {
                        values.push_back({ T(-u.value), T(-u.dx), T(-u.dy) });
                    }
                    else if (sign > 0) {
                        values.push_back(u);
                    }
                    else {
                        values.push_back({ zero, zero, zero });
                    }
                    break;
                }
                case ExpressionNodeType::Min: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    values.push_back((v.value < u.value) ? v : u);
                    break;
                }
                case ExpressionNodeType::Max: {
                    const ValueWithGradient<T>& u = values[node.lhs];
                    const ValueWithGradient<T>& v = values[node.rhs];
                    values.push_back((u.value < v.value) ? v : u);
                    break;
                }
                default:
                    assert(false);
                    break;
            }
        }

        ValueWithGradient<T> result = values.back();
        checkFinite(result.value, "payoff evaluation");
        checkFinite(result.dx, "payoff gradient");
        checkFinite(result.dy, "payoff gradient");
        return result;
    }

    // Total degree in (x, y) if the expression is a polynomial, otherwise std::nullopt
    std::optional<int> getPolynomialDegree() const {
        assert(!m_nodes.empty());

        std::vector<std::optional<int>> degrees;
        degrees.reserve(m_nodes.size());

        for (const ExpressionNode& node : m_nodes) {
            switch (node.type) {
                case ExpressionNodeType::Constant:
                    degrees.push_back(0);
                    break;
                case ExpressionNodeType::VariableX:
                case ExpressionNodeType::VariableY:
                    degrees.push_back(1);
                    break;
                case ExpressionNodeType::Negate:
                    degrees.push_back(degrees[node.lhs]);
                    break;
                case ExpressionNodeType::Add:
                case ExpressionNodeType::Subtract:
                    if (degrees[node.lhs] && degrees[node.rhs]) {
                        degrees.push_back(std::max(*degrees[node.lhs], *degrees[node.rhs]));
                    }
                    else {
                        degrees.push_back(std::nullopt);
                    }
                    break;
                case ExpressionNodeType::Multiply:
                    if (degrees[node.lhs] && degrees[node.rhs]) {
                        degrees.push_back(*degrees[node.lhs] + *degrees[node.rhs]);
                    }
                    else {
                        degrees.push_back(std::nullopt);
                    }
                    break;
                case ExpressionNodeType::Divide:
                    // Only division by a constant keeps a polynomial
                    if (degrees[node.rhs] == 0) {
                        degrees.push_back(degrees[node.lhs]);
                    }
                    else {
                        degrees.push_back(std::nullopt);
                    }
                    break;
                case ExpressionNodeType::Power:
                    if (degrees[node.lhs]) {
                        degrees.push_back(*degrees[node.lhs] * static_cast<int>(node.data));
                    }
                    else {
                        degrees.push_back(std::nullopt);
                    }
                    break;
                case ExpressionNodeType::Abs:
                    degrees.push_back((degrees[node.lhs] == 0) ? std::optional<int>{ 0 } : std::nullopt);
                    break;
                case ExpressionNodeType::Min:
                case ExpressionNodeType::Max:
                    if (degrees[node.lhs] == 0 && degrees[node.rhs] == 0) {
                        degrees.push_back(0);
                    }
                    else {
                        degrees.push_back(std::nullopt);
                    }
                    break;
                default:
                    assert(false);
                    degrees.push_back(std::nullopt);
                    break;
            }
        }

        return degrees.back();
    }

    std::string toString(const std::string& xName, const std::string& yName) const {
        assert(!m_nodes.empty());
        return nodeToString(getRootIndex(), xName, yName);
    }

private:
    static bool isBinary(ExpressionNodeType type) {
        switch (type) {
            case ExpressionNodeType::Add:
            case ExpressionNodeType::Subtract:
            case ExpressionNodeType::Multiply:
            case ExpressionNodeType::Divide:
            case ExpressionNodeType::Min:
            case ExpressionNodeType::Max:
                return true;
            default:
                return false;
        }
    }

    static T raiseToPower(const T& base, std::size_t exponent) {
        T result = FieldTraits<T>::one();
        T square = base;
        while (exponent > 0) {
            if (exponent & 1) {
                result = result * square;
            }
            exponent >>= 1;
            if (exponent > 0) {
                square = square * square;
            }
        }
        return result;
    }

    std::size_t addNode(const ExpressionNode& node) {
        m_nodes.push_back(node);
        return m_nodes.size() - 1;
    }

    // Binding strength used to decide where parentheses are needed
    int getPrecedence(std::size_t index) const {
        const ExpressionNode& node = m_nodes[index];
        switch (node.type) {
            case ExpressionNodeType::Add:
            case ExpressionNodeType::Subtract:
                return 1;
            case ExpressionNodeType::Multiply:
            case ExpressionNodeType::Divide:
                return 2;
            case ExpressionNodeType::Negate:
                return 3;
            case ExpressionNodeType::Power:
                return 4;
            case ExpressionNodeType::Constant: {
                const T& value = m_constants[node.data];
                if (value < FieldTraits<T>::zero()) {
                    return 3;
                }
                // Rationals print as "p/q"
                return (FieldTraits<T>::toString(value).find('/') != std::string::npos) ? 2 : 5;
            }
            default:
                return 5;
        }
    }

    // A piece of output: either literal text or a node printed in a context of the given precedence
    struct OutputPiece {
        std::string text;
        std::size_t index;
        int minimumPrecedence;
        bool isNode;
    };

    static OutputPiece makeTextPiece(std::string text) {
        return OutputPiece{ std::move(text), 0, 0, false };
    }

    static OutputPiece makeNodePiece(std::size_t index, int minimumPrecedence) {
        return OutputPiece{ "", index, minimumPrecedence, true };
    }

    // Uses an explicit stack since long operator chains nest as deeply as they are long
    std::string nodeToString(std::size_t rootIndex, const std::string& xName, const std::string& yName) const {
        std::string output;
        std::vector<OutputPiece> stack = { makeNodePiece(rootIndex, 0) };

        auto pushPieces = [&stack](std::initializer_list<OutputPiece> pieces) {
            for (auto it = std::rbegin(pieces); it != std::rend(pieces); ++it) {
                stack.push_back(*it);
            }
        };

        while (!stack.empty()) {
            OutputPiece piece = std::move(stack.back());
            stack.pop_back();

            if (!piece.isNode) {
                output += piece.text;
                continue;
            }

            if (getPrecedence(piece.index) < piece.minimumPrecedence) {
                pushPieces({ makeTextPiece("("), makeNodePiece(piece.index, 0), makeTextPiece(")") });
                continue;
            }

            const ExpressionNode& node = m_nodes[piece.index];
            switch (node.type) {
                case ExpressionNodeType::Constant:
                    output += FieldTraits<T>::toString(m_constants[node.data]);
                    break;
                case ExpressionNodeType::VariableX:
                    output += xName;
                    break;
                case ExpressionNodeType::VariableY:
                    output += yName;
                    break;
                case ExpressionNodeType::Negate:
                    pushPieces({ makeTextPiece("-"), makeNodePiece(node.lhs, 4) });
                    break;
                case ExpressionNodeType::Add:
                    pushPieces({ makeNodePiece(node.lhs, 1), makeTextPiece(" + "), makeNodePiece(node.rhs, 2) });
                    break;
                case ExpressionNodeType::Subtract:
                    pushPieces({ makeNodePiece(node.lhs, 1), makeTextPiece(" - "), makeNodePiece(node.rhs, 2) });
                    break;
                case ExpressionNodeType::Multiply:
                    pushPieces({ makeNodePiece(node.lhs, 2), makeTextPiece("*"), makeNodePiece(node.rhs, 3) });
                    break;
                case ExpressionNodeType::Divide:
                    pushPieces({ makeNodePiece(node.lhs, 2), makeTextPiece("/"), makeNodePiece(node.rhs, 3) });
                    break;
                case ExpressionNodeType::Power:
                    pushPieces({ makeNodePiece(node.lhs, 5), makeTextPiece("^" + std::to_string(node.data)) });
                    break;
                case ExpressionNodeType::Abs:
                    pushPieces({ makeTextPiece("abs("), makeNodePiece(node.lhs, 0), makeTextPiece(")") });
                    break;
                case ExpressionNodeType::Min:
                case ExpressionNodeType::Max:
                    pushPieces({
                        makeTextPiece((node.type == ExpressionNodeType::Min) ? "min(" : "max("),
                        makeNodePiece(node.lhs, 0),
                        makeTextPiece(", "),
                        makeNodePiece(node.rhs, 0),
                        makeTextPiece(")")
                    });
                    break;
                default:
                    assert(false);
                    break;
            }
        }

        return output;
    }

    std::vector<ExpressionNode> m_nodes;
    std::vector<T> m_constants;
};

#endif // EXPRESSION_HPP
