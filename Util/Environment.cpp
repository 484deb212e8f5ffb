
#include "Util/Environment.h"

#include <QByteArray>

/**
 * @brief Reads an environment variable, decoded with the local 8-bit
 * encoding.
 *
 * @param name The name of the variable.
 * @return The value, or a null QString if the variable is not set. A
 * variable which is set but empty yields an empty, non null, QString.
 */
QString GetEnvironmentVariable(const char *name) {
	const QByteArray value = qgetenv(name);
	if (value.isNull()) {
		return QString();
	}

	return QString::fromLocal8Bit(value);
}
