
#ifndef PROGRAM_CACHE_H_
#define PROGRAM_CACHE_H_

#include "Program.h"

#include <QByteArray>
#include <QCache>
#include <QMutex>

#include <cstddef>
#include <memory>
#include <string_view>

namespace RegVM {

/**
 * Compiled programs keyed by their pattern text, evicting the least
 * recently used entry once `capacity` patterns are held. One cache may be
 * shared between threads.
 */
class ProgramCache {
public:
	explicit ProgramCache(size_t capacity);
	ProgramCache(const ProgramCache &)            = delete;
	ProgramCache &operator=(const ProgramCache &) = delete;
	~ProgramCache()                               = default;

public:
	std::shared_ptr<const Program> get(std::string_view pattern);
	size_t size() const;
	size_t capacity() const;
	void clear();

private:
	mutable QMutex mutex_;
	QCache<QByteArray, std::shared_ptr<const Program>> cache_;
};

}

#endif
