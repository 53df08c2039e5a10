/**
 * @file JsonSnapshotStore.hpp
 * @brief Read-only store serving all collaborator interfaces from one JSON document.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/repositories/IHolidayRepository.hpp"
#include "domain/repositories/IPaycheckRepository.hpp"
#include "domain/repositories/IScheduleRepository.hpp"
#include "domain/repositories/IShiftEntryRepository.hpp"

namespace paytrack::infrastructure {

/**
 * @class JsonSnapshotStore
 * @brief Immutable snapshot of schedules, holidays, timesheets and statements.
 *
 * Everything is parsed up front, so one computation never observes a
 * half-edited data set.
 *
 * Document layout:
 * @code
 * {
 *   "schedules":  [{"year", "weekday" (0 = Monday), "is_workday", "start_time", "end_time"}],
 *   "holidays":   [{"year", "name", "date"}],
 *   "timesheets": [{"period_ending", "entries": [{"day_date", "start_time", "end_time",
 *                                                 "leave_type", "ojti_hours", "cic_hours"}]}],
 *   "paychecks":  [{"id", "pay_date", "period_ending", "agency", "gross_pay", "total_deductions",
 *                   "net_pay", "remarks", "earnings": [...], "deductions": [...], "leave": [...]}]
 * }
 * @endcode
 */
class JsonSnapshotStore : public domain::IScheduleRepository,
                          public domain::IHolidayRepository,
                          public domain::IShiftEntryRepository,
                          public domain::IPaycheckRepository {
public:
    /** @brief An empty snapshot; FromString() and LoadFile() fill one in. */
    JsonSnapshotStore() = default;

    /**
     * @brief Parses a snapshot document.
     * @throws std::runtime_error on malformed JSON or missing required fields.
     * @throws std::invalid_argument on malformed dates or times.
     */
    static std::shared_ptr<JsonSnapshotStore> FromString(const std::string& jsonText);

    /**
     * @brief Reads and parses a snapshot file.
     * @throws std::runtime_error if the file cannot be read, plus the FromString() errors.
     */
    static std::shared_ptr<JsonSnapshotStore> LoadFile(const std::string& path);

    std::vector<domain::ScheduleEntry> findSchedule(int year) override;
    std::vector<domain::Holiday> findHolidays(int year) override;

    std::vector<domain::ShiftEntry> findByPeriod(const domain::CivilDate& periodEnding) override;
    bool hasSavedEntries(const domain::CivilDate& periodEnding) override;

    std::optional<domain::DeclaredPaycheck> findById(const std::string& id) override;
    std::vector<domain::DeclaredPaycheck> findAll() override;

private:
    std::map<int, std::vector<domain::ScheduleEntry>> m_schedules;
    std::map<int, std::vector<domain::Holiday>> m_holidays;
    std::map<long, std::vector<domain::ShiftEntry>> m_timesheets; ///< Keyed by period-end day number.
    std::vector<domain::DeclaredPaycheck> m_paychecks;
};

} // namespace paytrack::infrastructure
