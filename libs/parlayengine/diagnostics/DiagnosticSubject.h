// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __DIAGNOSTIC_SUBJECT_H
#define __DIAGNOSTIC_SUBJECT_H 1

#include <vector>
#include <algorithm>
#include "IRecommendationObserver.h"

namespace parlayrec::diagnostics
{
    /**
     * @class DiagnosticSubject
     * @brief Subject side of the observer pattern for recommendation diagnostics.
     *
     * Holds non-owning observer pointers; an attached observer must outlive
     * the subject or be detached first. The recommender is single threaded,
     * so the list is not locked.
     */
    class DiagnosticSubject {
    protected:
        std::vector<IRecommendationObserver*> m_observers;

    public:
        virtual ~DiagnosticSubject() = default;

        virtual void attach(IRecommendationObserver* observer) {
            if (observer)
                m_observers.push_back(observer);
        }

        virtual void detach(IRecommendationObserver* observer) {
            m_observers.erase(
                std::remove(m_observers.begin(), m_observers.end(), observer),
                m_observers.end()
            );
        }

        std::size_t getNumObservers() const {
            return m_observers.size();
        }

        void notifyObservers(const RecommendationDiagnosticRecord& record) const {
            for (auto* observer : m_observers) {
                observer->onDiagnosticEvent(record);
            }
        }
    };
}

#endif
