
#ifndef FROM_INTEGER_H_
#define FROM_INTEGER_H_

/**
 * @brief Converts a stored integer back into an enumeration. Every
 * enumeration which is persisted provides a specialization which validates
 * the value.
 */
template <class T>
T FromInteger(int value);

#endif
