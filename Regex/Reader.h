
#ifndef READER_H_
#define READER_H_

#include <cstddef>
#include <string_view>

namespace RegVM {

template <class Ch>
class BasicReader {
public:
	/**
	 * @brief Construct a new Basic Reader object for scanning a pattern.
	 *
	 * @param input The string to read from
	 *
	 * @note The string must remain valid for the lifetime of the reader.
	 */
	explicit BasicReader(std::basic_string_view<Ch> input) noexcept
		: input_(input) {
	}

	BasicReader()                                  = default;
	BasicReader(const BasicReader &other)          = default;
	BasicReader &operator=(const BasicReader &rhs) = default;
	~BasicReader()                                 = default;

public:
	/**
	 * @brief Determines if the reader has reached the end of the input string.
	 *
	 * @return `true` if the end of the input string has been reached, `false` otherwise.
	 */
	bool eof() const noexcept {
		return index_ == input_.size();
	}

	/**
	 * @brief Returns the next character in the string without advancing the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch peek() const noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_];
	}

	/**
	 * @brief Determines if the next character in the string matches `ch`.
	 * A NUL in the pattern is an ordinary character, so this is never
	 * true at the end of the input.
	 *
	 * @return `true` if the next character matches `ch`, `false` otherwise.
	 */
	bool next_is(Ch ch) const noexcept {
		return !eof() && input_[index_] == ch;
	}

	/**
	 * @brief Reads the next character in the string and advances the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch read() noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_++];
	}

	/**
	 * @brief If the `ch` matches the char at the current position, consume it and advance the position.
	 *
	 * @param ch The character to match.
	 * @return `true` if the next character matches `ch`, `false` otherwise.
	 */
	bool match(Ch ch) noexcept {
		if (!next_is(ch)) {
			return false;
		}

		++index_;
		return true;
	}

	/**
	 * @brief Get the current position in the string
	 *
	 * @return The current index in the string.
	 */
	size_t index() const noexcept {
		return index_;
	}

private:
	std::basic_string_view<Ch> input_;
	size_t index_ = 0;
};

using Reader = BasicReader<char>;

}

#endif
