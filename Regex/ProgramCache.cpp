
#include "ProgramCache.h"
#include "Regex.h"
#include "Util/Raise.h"

#include <QMutexLocker>
#include <QtDebug>

#include <limits>

#include <gsl/gsl>

namespace RegVM {

/**
 * @brief ProgramCache constructor.
 *
 * @param capacity The number of programs to keep. 0 disables caching.
 */
ProgramCache::ProgramCache(size_t capacity) {
	cache_.setMaxCost(gsl::narrow<int>(capacity));
}

/**
 * @brief Returns the program for `pattern`, compiling it on a cache miss.
 * Patterns which fail to compile are not cached; the error propagates.
 *
 * @param pattern The pattern text.
 * @return The compiled program.
 */
std::shared_ptr<const Program> ProgramCache::get(std::string_view pattern) {

	// far beyond anything which fits into MaxProgramSize instructions, and
	// beyond what a QByteArray key can hold
	if (pattern.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
		Raise<CodeGenError>(CodeGenError::PcOverflow, "pattern of %zu bytes cannot fit in %zu instructions", pattern.size(), MaxProgramSize);
	}

	const QByteArray key(pattern.data(), gsl::narrow<int>(pattern.size()));

	{
		QMutexLocker locker(&mutex_);
		if (std::shared_ptr<const Program> *program = cache_.object(key)) {
			return *program;
		}
	}

	// compile outside of the lock, concurrent misses on the same pattern
	// just compile it twice
	std::shared_ptr<const Program> program = compile(pattern);

	QMutexLocker locker(&mutex_);
	qDebug("regvm: compiled uncached pattern (%d of %d cached)", static_cast<int>(cache_.size()), static_cast<int>(cache_.maxCost()));

	// the cache takes ownership of the copy, and deletes it right away if
	// it does not fit
	cache_.insert(key, new std::shared_ptr<const Program>(program));
	return program;
}

size_t ProgramCache::size() const {
	QMutexLocker locker(&mutex_);
	return static_cast<size_t>(cache_.size());
}

size_t ProgramCache::capacity() const {
	QMutexLocker locker(&mutex_);
	return static_cast<size_t>(cache_.maxCost());
}

void ProgramCache::clear() {
	QMutexLocker locker(&mutex_);
	cache_.clear();
}

}
