#include "occupancyGrid.hpp"
#include <algorithm>
#include "randomUtil.hpp"

OccupancyGrid::OccupancyGrid(int gridSize)
{
    this->size = gridSize > 0 ? gridSize : 0;
    this->cells.assign((size_t)this->size * (size_t)this->size, false);
    this->freeScratch.reserve(this->cells.size());
}

int OccupancyGrid::occupiedCount() const
{
    return (int)std::count(this->cells.begin(), this->cells.end(), true);
}

bool OccupancyGrid::isOccupied(int x, int z) const
{
    if (!this->inBounds(x, z))
        return false;
    return this->cells[(size_t)x * this->size + z];
}

void OccupancyGrid::markOccupied(int x, int z)
{
    if (this->inBounds(x, z))
        this->cells[(size_t)x * this->size + z] = true;
}

void OccupancyGrid::markFree(int x, int z)
{
    if (this->inBounds(x, z))
        this->cells[(size_t)x * this->size + z] = false;
}

void OccupancyGrid::clear()
{
    std::fill(this->cells.begin(), this->cells.end(), false);
}

std::optional<GridCell> OccupancyGrid::findRandomFreeCell()
{
    this->freeScratch.clear();
    for (int x = 0; x < this->size; x++)
    {
        for (int z = 0; z < this->size; z++)
        {
            if (!this->cells[(size_t)x * this->size + z])
                this->freeScratch.push_back({x, z});
        }
    }

    if (this->freeScratch.empty())
        return std::nullopt;

    return this->freeScratch[RandomIndex((int)this->freeScratch.size())];
}
