
#ifndef VERSION_H_
#define VERSION_H_

constexpr auto REGVM_VERSION_MAJ = 1;
constexpr auto REGVM_VERSION_REV = 2;

#endif
