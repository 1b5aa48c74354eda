#pragma once
#include <optional>
#include <vector>

/**
 * @brief Integer coordinates of one spawn cell.
 */
struct GridCell
{
    int x = 0;
    int z = 0;

    bool operator==(const GridCell &other) const { return this->x == other.x && this->z == other.z; }
    bool operator!=(const GridCell &other) const { return !(*this == other); }
};

/**
 * @brief Square boolean grid of claimed spawn cells.
 *
 * A cell is occupied from the moment a spawn claims it until the enemy on it
 * returns to the pool (or the spawn is aborted). Random selection rescans the
 * whole grid on every call; sizes stay small (at most MAX_GRID_SIZE per side).
 */
class OccupancyGrid
{
private:
    int size = 0;
    std::vector<bool> cells; // row-major, size * size
    std::vector<GridCell> freeScratch;

    bool inBounds(int x, int z) const { return x >= 0 && z >= 0 && x < this->size && z < this->size; }

public:
    explicit OccupancyGrid(int gridSize);

    int getSize() const { return this->size; }
    int cellCount() const { return this->size * this->size; }
    int occupiedCount() const;
    int freeCount() const { return this->cellCount() - this->occupiedCount(); }

    bool isOccupied(int x, int z) const;
    bool isOccupied(const GridCell &cell) const { return this->isOccupied(cell.x, cell.z); }

    // Out-of-range coordinates are ignored.
    void markOccupied(int x, int z);
    void markOccupied(const GridCell &cell) { this->markOccupied(cell.x, cell.z); }
    void markFree(int x, int z);
    void markFree(const GridCell &cell) { this->markFree(cell.x, cell.z); }
    void clear();

    /**
     * @brief Pick a free cell uniformly at random.
     *
     * @return the cell, or std::nullopt when every cell is occupied.
     */
    std::optional<GridCell> findRandomFreeCell();
};
