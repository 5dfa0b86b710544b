#pragma once
#include "../core/Errors.hpp"
#include <eigen3/Eigen/Dense>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace randomwalk {

/**
 * @brief Table alignée : colonne 0 = temps, colonnes 1..N = trajectoires.
 *
 * La cellule (i, j) de la trajectoire j est appariée au temps de la ligne i.
 * Immuable une fois construite.
 */
class TimeSeriesTable {
private:
    Eigen::MatrixXd data_;
    std::vector<std::string> columnNames_;

public:
    TimeSeriesTable(Eigen::MatrixXd data, std::vector<std::string> columnNames)
        : data_(std::move(data)), columnNames_(std::move(columnNames)) {
        if (data_.cols() < 2 || data_.rows() < 1) {
            throw DimensionMismatch("A table needs a time column, one walk column and one row");
        }
        if (columnNames_.size() != static_cast<std::size_t>(data_.cols())) {
            throw DimensionMismatch("Column names do not match the column count");
        }
    }

    [[nodiscard]] std::size_t rowCount() const noexcept {
        return static_cast<std::size_t>(data_.rows());
    }

    [[nodiscard]] std::size_t columnCount() const noexcept {
        return static_cast<std::size_t>(data_.cols());
    }

    [[nodiscard]] std::size_t walkCount() const noexcept { return columnCount() - 1; }

    double at(std::size_t row, std::size_t col) const {
        if (row >= rowCount() || col >= columnCount()) {
            throw std::out_of_range("Table cell out of range");
        }
        return data_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    double time(std::size_t row) const { return at(row, 0); }

    std::vector<double> column(std::size_t col) const {
        if (col >= columnCount()) {
            throw std::out_of_range("Table column out of range");
        }
        const auto c = data_.col(static_cast<Eigen::Index>(col));
        return std::vector<double>(c.data(), c.data() + c.size());
    }

    std::vector<double> timeColumn() const { return column(0); }

    // Colonne de la trajectoire j (0-based)
    std::vector<double> walkColumn(std::size_t j) const { return column(j + 1); }

    const std::vector<std::string>& columnNames() const noexcept { return columnNames_; }
    const Eigen::MatrixXd& matrix() const noexcept { return data_; }
};

} // namespace randomwalk
