#pragma once
#include <Eigen/Dense>
#include <vector>
namespace ramancal {
	using Real        = double;
	using Vector      = Eigen::VectorXd;
	using Matrix      = Eigen::MatrixXd;
	using IndexVector = std::vector<Eigen::Index>;   // detector positions
} // namespace ramancal
