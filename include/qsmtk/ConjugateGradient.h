/*
 * QSMTK : QSM reconstruction based on MIRTK
 *
 * Copyright 2021- King's College London
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

// QSMTK
#include "qsmtk/Common.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /**
     * @brief Linear operator acting on volumes.
     * Implementations must be symmetric positive (semi-)definite when used
     * with ConjugateGradient.
     */
    class LinearOperator {
    public:
        virtual ~LinearOperator() = default;

        /// Compute y = A(x)
        virtual RealImage Apply(const RealImage& x) const = 0;
    };

    /// Weighted sum of two operators: A(x) = alpha * A1(x) + beta * A2(x)
    class SumOperator : public LinearOperator {
        const LinearOperator& _first;
        const LinearOperator& _second;
        double _alpha;
        double _beta;

    public:
        SumOperator(const LinearOperator& first, const LinearOperator& second, double alpha = 1, double beta = 1) :
            _first(first), _second(second), _alpha(alpha), _beta(beta) {}

        RealImage Apply(const RealImage& x) const override;
    };

    /**
     * @brief Conjugate-gradient solver for A(x) = b starting from x = 0.
     * Iteration stops when the residual norm falls below the absolute
     * tolerance or after the maximum number of iterations. Reaching the
     * iteration cap is not an error, the current estimate is returned.
     */
    class ConjugateGradient {
    protected:
        /// Absolute tolerance on the residual norm
        double _tolerance;

        /// Maximum number of iterations
        int _max_iterations;

        /// Residual norm before the first and after every iteration
        Array<double> _residual_history;

        int _iterations;
        bool _converged;

    public:
        ConjugateGradient(double tolerance = 0.01, int max_iterations = 100);

        /**
         * @brief Solve A(x) = b.
         * @param A Symmetric positive (semi-)definite operator.
         * @param b Right-hand side.
         * @return Estimate of x on the grid of b.
         */
        RealImage Solve(const LinearOperator& A, const RealImage& b);

        inline const Array<double>& ResidualHistory() const {
            return _residual_history;
        }

        inline int Iterations() const {
            return _iterations;
        }

        inline bool Converged() const {
            return _converged;
        }
    };

} // namespace qsmtk
