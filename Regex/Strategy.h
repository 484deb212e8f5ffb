
#ifndef STRATEGY_H_
#define STRATEGY_H_

#include "Util/FromInteger.h"

#include <QLatin1String>
#include <QString>
#include <QtDebug>

namespace RegVM {

// How a program is executed.
enum class Strategy {
	Backtracking, // depth first, exponential worst case
	Parallel,     // simulates all threads in lock step, linear time
};

inline QLatin1String ToString(Strategy strategy) {

	switch (strategy) {
	case Strategy::Backtracking:
		return QLatin1String("backtrack");
	case Strategy::Parallel:
		return QLatin1String("parallel");
	}

	Q_UNREACHABLE();
}

}

template <>
inline RegVM::Strategy FromInteger(int value) {
	switch (value) {
	case static_cast<int>(RegVM::Strategy::Backtracking):
	case static_cast<int>(RegVM::Strategy::Parallel):
		return static_cast<RegVM::Strategy>(value);
	default:
		qWarning("regvm: Invalid value for Strategy");
		return RegVM::Strategy::Parallel;
	}
}

#endif
