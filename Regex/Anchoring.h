
#ifndef ANCHORING_H_
#define ANCHORING_H_

#include "Util/FromInteger.h"

#include <QLatin1String>
#include <QString>
#include <QtDebug>

namespace RegVM {

// Where a Match instruction is allowed to accept.
enum class Anchoring {
	Full,   // only once the whole input has been consumed
	Prefix, // as soon as it is reached, ignoring any remaining input
};

inline QLatin1String ToString(Anchoring anchoring) {

	switch (anchoring) {
	case Anchoring::Full:
		return QLatin1String("full");
	case Anchoring::Prefix:
		return QLatin1String("prefix");
	}

	Q_UNREACHABLE();
}

}

template <>
inline RegVM::Anchoring FromInteger(int value) {
	switch (value) {
	case static_cast<int>(RegVM::Anchoring::Full):
	case static_cast<int>(RegVM::Anchoring::Prefix):
		return static_cast<RegVM::Anchoring>(value);
	default:
		qWarning("regvm: Invalid value for Anchoring");
		return RegVM::Anchoring::Full;
	}
}

#endif
