
#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <QString>

QString GetEnvironmentVariable(const char *name);

#endif
