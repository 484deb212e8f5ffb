
#ifndef SETTINGS_H_
#define SETTINGS_H_

#include "Anchoring.h"
#include "Execute.h"
#include "Strategy.h"

#include <QString>

namespace Settings {

void Load();
void Load(const QString &filename);
bool Save();
bool Save(const QString &filename);
void Reset();

QString ConfigFile();

RegVM::EvalOptions CurrentEvalOptions();

extern RegVM::Strategy strategy;
extern RegVM::Anchoring anchoring;
extern int stepLimit;
extern int cacheSize;

}

#endif
