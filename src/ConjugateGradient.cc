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

// QSMTK
#include "qsmtk/ConjugateGradient.h"

namespace qsmtk {

    RealImage SumOperator::Apply(const RealImage& x) const {
        RealImage y = _first.Apply(x);
        const RealImage y2 = _second.Apply(x);
        Utility::CheckSameGrid(y, y2, "SumOperator");

        RealPixel *py = y.Data();
        const RealPixel *py2 = y2.Data();
        #pragma omp parallel for
        for (int i = 0; i < y.NumberOfVoxels(); i++)
            py[i] = _alpha * py[i] + _beta * py2[i];

        return y;
    }

    //-------------------------------------------------------------------

    ConjugateGradient::ConjugateGradient(double tolerance, int max_iterations) :
        _tolerance(tolerance), _max_iterations(max_iterations), _iterations(0), _converged(false) {
        if (!(tolerance >= 0))
            throw invalid_argument("Conjugate gradient tolerance must be non-negative, got " + to_string(tolerance));
        if (max_iterations < 1)
            throw invalid_argument("Conjugate gradient iteration cap must be positive, got " + to_string(max_iterations));
    }

    //-------------------------------------------------------------------

    RealImage ConjugateGradient::Solve(const LinearOperator& A, const RealImage& b) {
        const int n = b.NumberOfVoxels();

        RealImage x(b.Attributes());
        x = 0;
        RealImage r = b;
        RealImage p = r;

        double rsold = Utility::Dot(r, r);
        Utility::ClearAndReserve(_residual_history, _max_iterations + 1);
        _residual_history.push_back(sqrt(rsold));
        _iterations = 0;
        _converged = sqrt(rsold) < _tolerance;

        while (!_converged && _iterations < _max_iterations) {
            const RealImage Ap = A.Apply(p);
            const double pAp = Utility::Dot(p, Ap);
            // Operator is singular along p
            if (pAp <= 0)
                break;

            const double alpha = rsold / pAp;
            RealPixel *px = x.Data();
            RealPixel *pr = r.Data();
            RealPixel *pp = p.Data();
            const RealPixel *pq = Ap.Data();
            #pragma omp parallel for
            for (int i = 0; i < n; i++) {
                px[i] += alpha * pp[i];
                pr[i] -= alpha * pq[i];
            }

            const double rsnew = Utility::Dot(r, r);
            _iterations++;
            _residual_history.push_back(sqrt(rsnew));

            if (sqrt(rsnew) < _tolerance) {
                _converged = true;
                break;
            }

            const double beta = rsnew / rsold;
            #pragma omp parallel for
            for (int i = 0; i < n; i++)
                pp[i] = pr[i] + beta * pp[i];

            rsold = rsnew;
        }

        return x;
    }

}
