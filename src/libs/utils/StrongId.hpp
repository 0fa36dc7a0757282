// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QtGlobal>

#include <optional>

namespace Utils {

// Typed 64-bit handle. Zero is the null value; allocation is left to the
// owner of the id space (usually a monotonically increasing counter).
template <typename Tag>
class StrongId final
{
public:
	using value_type = quint64;

	constexpr StrongId() = default;
	explicit constexpr StrongId(value_type v) : m_value(v) {}

	static constexpr StrongId null() noexcept { return StrongId{}; }

	constexpr value_type value() const noexcept { return m_value; }
	constexpr bool isNull() const noexcept { return m_value == 0; }
	constexpr bool isValid() const noexcept { return m_value != 0; }

	explicit constexpr operator bool() const noexcept { return isValid(); }

	QString toString() const { return QString::number(m_value); }

	static std::optional<StrongId> fromString(const QString& text)
	{
		bool ok = false;
		const value_type v = text.trimmed().toULongLong(&ok);
		if (!ok || v == 0)
			return std::nullopt;
		return StrongId(v);
	}

	friend constexpr bool operator==(StrongId a, StrongId b) noexcept { return a.m_value == b.m_value; }
	friend constexpr bool operator!=(StrongId a, StrongId b) noexcept { return a.m_value != b.m_value; }
	friend constexpr bool operator<(StrongId a, StrongId b) noexcept { return a.m_value < b.m_value; }

	friend size_t qHash(StrongId id, size_t seed = 0) noexcept { return ::qHash(id.m_value, seed); }

private:
	value_type m_value = 0;
};

// Hands out ids for one id space. Never reuses a value.
template <typename Id>
class StrongIdAllocator final
{
public:
	Id next() noexcept { return Id(++m_last); }
	typename Id::value_type last() const noexcept { return m_last; }

private:
	typename Id::value_type m_last = 0;
};

} // namespace Utils
